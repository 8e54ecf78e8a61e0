#include <jx/parse_error.h>
#include <jx/utf8.h>
#include <sstream>

namespace jx {

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::UnexpectedEnd: return "UnexpectedEnd";
        case ErrorKind::UnexpectedChar: return "UnexpectedChar";
        case ErrorKind::InvalidLiteral: return "InvalidLiteral";
        case ErrorKind::InvalidEscape: return "InvalidEscape";
        case ErrorKind::InvalidUnicodeEscape: return "InvalidUnicodeEscape";
        case ErrorKind::ControlCharInString: return "ControlCharInString";
        case ErrorKind::NumberTooLong: return "NumberTooLong";
        case ErrorKind::InvalidIntegerSyntax: return "InvalidIntegerSyntax";
        case ErrorKind::InvalidFloatSyntax: return "InvalidFloatSyntax";
        case ErrorKind::InvalidBase64Char: return "InvalidBase64Char";
        case ErrorKind::FormatNotSupported: return "FormatNotSupported";
        case ErrorKind::TrailingContent: return "TrailingContent";
        case ErrorKind::NestingTooDeep: return "NestingTooDeep";
    }
    return "Unknown";
}

namespace {
    constexpr size_t context_width = 72;

    std::string headline(const ParseError& error) {
        std::ostringstream ss;
        ss << error.message() << " (line " << error.line() + 1 << ", column " << error.column() + 1 << ")";
        return ss.str();
    }
}

std::string format_error(const ParseError& error, const std::u32string& source) {
    // find start of error line
    size_t pos = 0;
    size_t cur = 0;
    while (cur < error.line() and pos < source.size()) {
        if (source[pos] == U'\n') ++cur;
        ++pos;
    }
    size_t line_end = pos;
    while (line_end < source.size() and source[line_end] != U'\n') ++line_end;
    std::u32string line_text = source.substr(pos, line_end - pos);
    // drop a CR from CRLF input so the caret line stays aligned
    if (not line_text.empty() and line_text.back() == U'\r') line_text.pop_back();

    size_t caret_pos = error.column();
    if (caret_pos > line_text.size()) caret_pos = line_text.size();

    // long lines are cut to a window around the caret
    size_t from = 0;
    if (line_text.size() > context_width) {
        from = caret_pos > context_width / 2 ? caret_pos - context_width / 2 : 0;
        if (from + context_width > line_text.size()) from = line_text.size() - context_width;
    }
    std::string prefix = from > 0 ? "..." : "";
    std::string suffix = from + context_width < line_text.size() ? "..." : "";
    std::string caret(prefix.size() + caret_pos - from, ' ');
    caret.push_back('^');

    std::ostringstream ss;
    ss << headline(error) << "\n";
    ss << prefix << encode_utf8(line_text.substr(from, context_width)) << suffix << "\n" << caret;
    if (error.opened_at()) {
        auto o = *error.opened_at();
        ss << "\n(opened at line " << o.line + 1 << ", column " << o.column + 1 << ")";
    }
    return ss.str();
}

std::string format_error(const ParseError& error, const std::string& utf8_source) {
    return format_error(error, decode_utf8(utf8_source));
}

}  // namespace jx
