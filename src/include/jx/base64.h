#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace jx {
namespace base64 {

// A-Z a-z 0-9 + / and the '=' pad
bool is_alphabet_char(char32_t c) noexcept;

// Lenient decode: characters outside the alphabet are skipped and decoding
// stops at the first '='. A dangling single sextet is dropped.
std::vector<uint8_t> decode(const std::string& encoded);

}  // namespace base64
}  // namespace jx
