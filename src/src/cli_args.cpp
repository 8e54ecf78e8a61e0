#include <jx/cli_args.h>
#include <jx/cli_utils.h>
#include <cctype>
#include <stdexcept>
#include <vector>

namespace jx {

namespace {
    size_t parse_depth(const std::string& text) {
        if (text.empty()) throw std::invalid_argument("--max-depth requires a positive integer");
        for (char c : text) {
            if (not std::isdigit(static_cast<unsigned char>(c)))
                throw std::invalid_argument("--max-depth requires a positive integer, got '" + text + "'");
        }
        size_t depth = 0;
        try {
            depth = static_cast<size_t>(std::stoull(text));
        } catch (const std::out_of_range&) {
            throw std::invalid_argument("--max-depth value out of range: " + text);
        }
        if (depth == 0) throw std::invalid_argument("--max-depth must be at least 1");
        if (depth > max_depth_limit)
            throw std::invalid_argument("--max-depth must be at most " + std::to_string(max_depth_limit));
        return depth;
    }
}

CliArgs::CliArgs(int argc, const char* argv[]) {
    static const std::vector<std::string> valid_options = {
        "--help", "-h",
        "--standard",
        "--extended", "-x",
        "--max-depth",
        "--verbose", "-v"
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            action_ = Action::HELP;
            return;
        }
        else if (arg == "--standard") {
            options_.format = Format::Standard;
        }
        else if (arg == "--extended" || arg == "-x") {
            options_.format = Format::Extended;
        }
        else if (arg == "--max-depth") {
            if (i + 1 >= argc) {
                throw std::invalid_argument("--max-depth requires a value argument");
            }
            options_.max_depth = parse_depth(argv[++i]);
        }
        else if (arg == "--verbose" || arg == "-v") {
            verbose_ = true;
        }
        else if (arg.size() > 1 && arg[0] == '-') {
            throw std::invalid_argument(cli_utils::unknown_option_message(arg, valid_options));
        }
        else {
            if (!filePath_.empty()) {
                throw std::invalid_argument("only one input file may be given (got '" + filePath_ + "' and '" + arg + "')");
            }
            filePath_ = arg;
        }
    }

    action_ = filePath_.empty() ? Action::HELP : Action::PARSE;
}

} // namespace jx
