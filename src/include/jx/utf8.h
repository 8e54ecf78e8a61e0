#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace jx {

// Input bytes were not well-formed UTF-8. Raised before any parsing starts.
struct EncodingError : public std::invalid_argument {
    size_t offset;
    EncodingError(const std::string& msg, size_t byte_offset)
        : std::invalid_argument(msg), offset(byte_offset) {}
};

// Decode UTF-8 into scalar values. Rejects truncated, overlong and surrogate
// sequences and code points above U+10FFFF with EncodingError.
std::u32string decode_utf8(const char* data, size_t len);
std::u32string decode_utf8(const std::string& bytes);
std::u32string decode_utf8(const std::vector<uint8_t>& bytes);

// Append the UTF-8 encoding of cp. Surrogate code points are encoded as-is.
void encode_utf8(uint32_t cp, std::string& out);
std::string encode_utf8(const std::u32string& text);

}  // namespace jx
