#include <jx/json.h>
#include <jx/base64.h>
#include <jx/cursor.h>
#include <jx/utf8.h>
#include <locale>
#include <sstream>
#include <vector>

namespace jx {

namespace {
    constexpr size_t max_number_length = 256;

    bool is_digit(char32_t c) { return U'0' <= c and c <= U'9'; }

    bool is_number_char(char32_t c) {
        return is_digit(c) or c == U'+' or c == U'-' or c == U'.' or c == U'e' or c == U'E';
    }

    int hex_val(char32_t c) {
        if (U'0' <= c and c <= U'9') return static_cast<int>(c - U'0');
        if (U'a' <= c and c <= U'f') return 10 + static_cast<int>(c - U'a');
        if (U'A' <= c and c <= U'F') return 10 + static_cast<int>(c - U'A');
        return -1;
    }

    // State for a single parse call.
    struct ParserState {
        Cursor cursor;
        const Options& options;
        std::string token;

        struct Opener { Position at; };
        std::vector<Opener> opener_stack;

        ParserState(std::u32string text, const Options& opts) : cursor(std::move(text)), options(opts) {}

        std::optional<Position> innermost_opener() const {
            if (opener_stack.empty()) return std::nullopt;
            return opener_stack.back().at;
        }

        ParseError fail(ErrorKind kind, const std::string& msg) const {
            return cursor.error(kind, msg, innermost_opener());
        }

        ParseError reject(char32_t c, ErrorKind kind, const std::string& msg) {
            return cursor.reject(c, kind, msg, innermost_opener());
        }

        Result<char32_t> read() {
            if (cursor.at_end()) return fail(ErrorKind::UnexpectedEnd, "unexpected end of input");
            return cursor.next();
        }

        ParseResult run() {
            auto value = parse_value();
            if (not value) return value;
            cursor.skip_whitespace();
            if (not cursor.at_end()) {
                auto c = cursor.next();
                if (not c) return c.error();
                return reject(*c, ErrorKind::TrailingContent, "extra data after JSON value");
            }
            return value;
        }

        Result<Value> parse_value() {
            cursor.skip_whitespace();
            if (cursor.at_end()) return fail(ErrorKind::UnexpectedEnd, "unexpected end of input, expected a value");
            Position start = cursor.position();
            auto c = read();
            if (not c) return c.error();

            switch (*c) {
                case U'"': {
                    auto s = parse_string();
                    if (not s) return s.error();
                    return Value(std::move(*s));
                }
                case U'[':
                    return parse_array(start);
                case U'{':
                    return parse_object(start);
                case U'<': {
                    if (options.format != Format::Extended)
                        return reject(*c, ErrorKind::FormatNotSupported,
                                      "binary literals are only allowed in the extended format");
                    auto b = parse_binary();
                    if (not b) return b.error();
                    return Value(std::move(*b));
                }
                case U't':
                    return parse_literal(U"rue", Value(true), "true");
                case U'f':
                    return parse_literal(U"alse", Value(false), "false");
                case U'n':
                    return parse_literal(U"ull", Value(), "null");
                default:
                    break;
            }
            if (*c == U'-' or is_digit(*c)) {
                cursor.put_back(*c);
                return parse_number();
            }
            return reject(*c, ErrorKind::UnexpectedChar, "unexpected character while parsing value");
        }

        Result<Value> parse_literal(const char32_t* rest, Value v, const char* name) {
            for (const char32_t* p = rest; *p; ++p) {
                auto c = read();
                if (not c) return c.error();
                if (*c != *p) return reject(*c, ErrorKind::InvalidLiteral, std::string("invalid literal, expected '") + name + "'");
            }
            return v;
        }

        // opening quote already consumed
        Result<std::string> parse_string() {
            token.clear();
            while (true) {
                auto c = read();
                if (not c) return c.error();
                char32_t ch = *c;
                if (ch == U'"') break;
                if (ch < 0x20) return reject(ch, ErrorKind::ControlCharInString, "control character in string");
                if (ch != U'\\') {
                    encode_utf8(ch, token);
                    continue;
                }
                auto e = read();
                if (not e) return e.error();
                switch (*e) {
                    case U'"': token.push_back('"'); break;
                    case U'\\': token.push_back('\\'); break;
                    case U'/': token.push_back('/'); break;
                    case U'b': token.push_back('\b'); break;
                    case U'f': token.push_back('\f'); break;
                    case U'n': token.push_back('\n'); break;
                    case U'r': token.push_back('\r'); break;
                    case U't': token.push_back('\t'); break;
                    case U'u': {
                        // a single UTF-16 code unit; surrogates are not paired
                        uint32_t v = 0;
                        for (int k = 0; k < 4; ++k) {
                            auto h = read();
                            if (not h) return h.error();
                            int hv = hex_val(*h);
                            if (hv < 0) return reject(*h, ErrorKind::InvalidUnicodeEscape, "invalid unicode escape, expected a hex digit");
                            v = (v << 4) | static_cast<uint32_t>(hv);
                        }
                        encode_utf8(v, token);
                        break;
                    }
                    default:
                        return reject(*e, ErrorKind::InvalidEscape, "unsupported escape sequence");
                }
            }
            return token;
        }

        // first character already put back
        Result<Value> parse_number() {
            Position start = cursor.position();
            token.clear();
            bool is_floating = false;
            while (not cursor.at_end()) {
                auto c = read();
                if (not c) return c.error();
                if (not is_number_char(*c)) {
                    cursor.put_back(*c);
                    break;
                }
                if (token.size() == max_number_length)
                    return reject(*c, ErrorKind::NumberTooLong, "number exceeds the length limit of 256 characters");
                if (*c == U'.' or *c == U'e' or *c == U'E') is_floating = true;
                token.push_back(static_cast<char>(*c));
            }

            // the whole token has to convert, "1+2" or "1.2.3" are rejected here
            std::istringstream ss(token);
            ss.imbue(std::locale::classic());
            if (is_floating) {
                double d = 0.0;
                ss >> d;
                if (ss.fail() or ss.peek() != std::istringstream::traits_type::eof())
                    return ParseError(ErrorKind::InvalidFloatSyntax, "invalid floating point number '" + token + "'",
                                      start, innermost_opener());
                return Value(d);
            }
            int64_t v = 0;
            ss >> v;
            if (ss.fail() or ss.peek() != std::istringstream::traits_type::eof())
                return ParseError(ErrorKind::InvalidIntegerSyntax, "invalid integer '" + token + "'",
                                  start, innermost_opener());
            return Value(v);
        }

        // opening '<' already consumed
        Result<Bytes> parse_binary() {
            token.clear();
            while (true) {
                auto c = read();
                if (not c) return c.error();
                if (*c == U'>') break;
                if (not base64::is_alphabet_char(*c))
                    return reject(*c, ErrorKind::InvalidBase64Char, "character not allowed in base64 binary literal");
                token.push_back(static_cast<char>(*c));
            }
            return base64::decode(token);
        }

        ParseError too_deep(Position start) const {
            return ParseError(ErrorKind::NestingTooDeep,
                              "nesting exceeds the maximum depth of " + std::to_string(options.max_depth),
                              start, innermost_opener());
        }

        // opening '[' already consumed, start is its position
        Result<Value> parse_array(Position start) {
            if (opener_stack.size() >= options.max_depth) return too_deep(start);
            opener_stack.push_back(Opener{start});
            Value::list_t out;
            cursor.skip_whitespace();
            auto c = read();
            if (not c) return c.error();
            if (*c == U']') {
                opener_stack.pop_back();
                return Value(std::move(out));
            }
            cursor.put_back(*c);
            while (true) {
                auto v = parse_value();
                if (not v) return v;
                out.push_back(std::move(*v));
                cursor.skip_whitespace();
                auto d = read();
                if (not d) return d.error();
                if (*d == U']') break;
                if (*d != U',') return reject(*d, ErrorKind::UnexpectedChar, "expected ',' or ']'");
            }
            opener_stack.pop_back();
            return Value(std::move(out));
        }

        // opening '{' already consumed, start is its position
        Result<Value> parse_object(Position start) {
            if (opener_stack.size() >= options.max_depth) return too_deep(start);
            opener_stack.push_back(Opener{start});
            Object out;
            cursor.skip_whitespace();
            auto c = read();
            if (not c) return c.error();
            if (*c == U'}') {
                opener_stack.pop_back();
                return Value(std::move(out));
            }
            cursor.put_back(*c);
            while (true) {
                cursor.skip_whitespace();
                auto q = read();
                if (not q) return q.error();
                if (*q != U'"') return reject(*q, ErrorKind::UnexpectedChar, "expected string key");
                auto key = parse_string();
                if (not key) return key.error();
                cursor.skip_whitespace();
                auto colon = read();
                if (not colon) return colon.error();
                if (*colon != U':') return reject(*colon, ErrorKind::UnexpectedChar, "expected ':' after object key");
                auto v = parse_value();
                if (not v) return v;
                out.set(*key, std::move(*v));
                cursor.skip_whitespace();
                auto d = read();
                if (not d) return d.error();
                if (*d == U'}') break;
                if (*d != U',') return reject(*d, ErrorKind::UnexpectedChar, "expected ',' or '}'");
            }
            opener_stack.pop_back();
            return Value(std::move(out));
        }
    };
}

ParseResult Parser::parse(const std::u32string& text) const {
    ParserState state(text, options_);
    return state.run();
}

ParseResult Parser::parse(const std::string& utf8) const {
    return parse(decode_utf8(utf8));
}

ParseResult Parser::parse(const std::vector<uint8_t>& bytes) const {
    return parse(decode_utf8(bytes));
}

Value parse_json(const std::string& text, Format format) {
    auto result = Parser(format).parse(text);
    if (not result) throw ParseException(result.error(), format_error(result.error(), text));
    return std::move(result).value();
}

}  // namespace jx
