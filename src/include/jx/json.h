#pragma once

#include <jx/parse_error.h>
#include <jx/value.h>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace jx {

enum class Format {
    Standard,  // RFC 8259 JSON
    Extended   // JSON plus <base64> binary literals
};

// Upper bound for Options::max_depth. Parser clamps larger values to it.
constexpr size_t max_depth_limit = 2048;

struct Options {
    Format format = Format::Standard;
    // arrays and objects nested deeper than this fail with NestingTooDeep
    size_t max_depth = 512;
};

using ParseResult = Result<Value>;

// Parses exactly one JSON value per call. The configuration is fixed at
// construction; a Parser holds no per-call state and may be shared between
// threads.
class Parser {
public:
    Parser() = default;
    explicit Parser(Format format) { options_.format = format; }
    explicit Parser(const Options& options) : options_(options) {
        if (options_.max_depth > max_depth_limit) options_.max_depth = max_depth_limit;
    }

    // UTF-8 input. Throws EncodingError for malformed UTF-8; every other
    // failure is reported through the result.
    ParseResult parse(const std::string& utf8) const;
    ParseResult parse(const std::vector<uint8_t>& bytes) const;

    // Already decoded text.
    ParseResult parse(const std::u32string& text) const;

    Format format() const noexcept { return options_.format; }
    const Options& options() const noexcept { return options_; }

private:
    Options options_;
};

// Parse or throw ParseException (EncodingError for malformed UTF-8).
Value parse_json(const std::string& text, Format format = Format::Standard);

namespace json_literals {
    inline Value operator"" _json(const char* s, std::size_t len) {
        return parse_json(std::string(s, len));
    }
}

}  // namespace jx
