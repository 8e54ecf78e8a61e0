// jsonex - parse a JSON (or extended JSON) document and report the result

#include <jx/cli_args.h>
#include <jx/jsonex.h>

#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {

void showHelp() {
    std::cout << "jsonex - Parse JSON and extended JSON documents\n\n";
    std::cout << "USAGE:\n";
    std::cout << "  jsonex [OPTIONS] <file>\n\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  --standard           Plain JSON only (default)\n";
    std::cout << "  --extended, -x       Also accept <base64> binary literals\n";
    std::cout << "  --max-depth <n>      Maximum array/object nesting (default 512, at most 2048)\n";
    std::cout << "  --verbose, -v        Print parser settings to stderr\n";
    std::cout << "  --help, -h           Show this message\n\n";
    std::cout << "EXIT STATUS:\n";
    std::cout << "  0 parsed, 1 parse error, 2 usage, I/O or encoding error\n";
}

std::string shorten(const std::string& s, size_t n = 40) {
    if (s.size() <= n) return s;
    return s.substr(0, n - 3) + "...";
}

std::string scalar(const jx::Value& val) {
    std::ostringstream ss;
    switch (val.type()) {
        case jx::Value::Type::Null: return "null";
        case jx::Value::Type::Boolean: return val.as_bool() ? "true" : "false";
        case jx::Value::Type::Integer: return std::to_string(val.as_int());
        case jx::Value::Type::Double: ss << val.as_double(); return ss.str();
        case jx::Value::Type::String: return '"' + shorten(val.as_string()) + '"';
        case jx::Value::Type::Array: ss << "[array, " << val.size() << " items]"; return ss.str();
        case jx::Value::Type::Object: ss << "{object, " << val.size() << " keys}"; return ss.str();
        case jx::Value::Type::Binary: ss << "<binary, " << val.size() << " bytes>"; return ss.str();
    }
    return "?";
}

// One line: the value itself, or its kind plus the first few members.
std::string preview(const jx::Value& val) {
    std::ostringstream ss;
    ss << scalar(val);
    size_t shown = 0;
    if (val.is_dict()) {
        for (auto const& p : val.as_dict().data) {
            if (shown++ >= 3) break;
            ss << (shown == 1 ? " " : ", ") << shorten(p.first) << "=" << scalar(p.second);
        }
    } else if (val.is_list()) {
        for (auto const& e : val.as_list()) {
            if (shown++ >= 3) break;
            ss << (shown == 1 ? " " : ", ") << scalar(e);
        }
    }
    if (shown > 3) ss << ", ...";
    return ss.str();
}

}  // namespace

int main(int argc, const char* argv[]) {
    try {
        jx::CliArgs args(argc, argv);

        if (args.getAction() == jx::CliArgs::Action::HELP) {
            showHelp();
            return 0;
        }

        std::ifstream in(args.getFilePath(), std::ios::binary);
        if (!in) {
            std::cerr << "error: cannot open file: " << args.getFilePath() << "\n";
            return 2;
        }
        std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

        const jx::Options& options = args.getOptions();
        const char* mode = options.format == jx::Format::Extended ? "extended JSON" : "JSON";
        if (args.isVerbose()) {
            std::cerr << "format: " << mode << "\n";
            std::cerr << "input: " << args.getFilePath() << " (" << content.size() << " bytes)\n";
            std::cerr << "max depth: " << options.max_depth << "\n";
        }

        std::u32string text = jx::decode_utf8(content);
        jx::Parser parser(options);
        auto result = parser.parse(text);
        if (!result) {
            std::cerr << "parse error: " << jx::to_string(result.error().kind()) << ": "
                      << jx::format_error(result.error(), text) << "\n";
            return 1;
        }

        std::cout << "OK: parsed " << mode << "; value: " << preview(*result) << "\n";
        return 0;

    } catch (const jx::EncodingError& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 2;
    } catch (const std::invalid_argument& e) {
        std::cerr << "error: " << e.what() << "\n";
        std::cerr << "usage: jsonex [--standard|--extended] [--max-depth N] [--verbose] <file>\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 2;
    }
}
