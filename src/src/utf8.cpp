#include <jx/utf8.h>

namespace jx {

namespace {
    [[noreturn]] void fail(size_t pos) {
        throw EncodingError("invalid utf-8 sequence at byte " + std::to_string(pos), pos);
    }

    // Byte is char or uint8_t
    template <typename Byte>
    std::u32string decode(const Byte* data, size_t len) {
        std::u32string out;
        out.reserve(len);
        size_t pos = 0;
        while (pos < len) {
            unsigned char ch = static_cast<unsigned char>(data[pos]);
            if (ch < 0x80) {
                out.push_back(static_cast<char32_t>(ch));
                ++pos;
                continue;
            }
            int needed = 0;
            uint32_t code = 0;
            uint32_t min_value = 0;
            if ((ch & 0xE0) == 0xC0) {
                needed = 1;
                code = ch & 0x1F;
                min_value = 0x80;
            } else if ((ch & 0xF0) == 0xE0) {
                needed = 2;
                code = ch & 0x0F;
                min_value = 0x800;
            } else if ((ch & 0xF8) == 0xF0) {
                needed = 3;
                code = ch & 0x07;
                min_value = 0x10000;
            } else {
                fail(pos);
            }
            // truncated sequence
            if (pos + static_cast<size_t>(needed) >= len) fail(pos);
            for (int k = 1; k <= needed; ++k) {
                unsigned char next = static_cast<unsigned char>(data[pos + k]);
                if ((next & 0xC0) != 0x80) fail(pos + k);
                code = (code << 6) | (next & 0x3F);
            }
            if (code < min_value or code > 0x10FFFF or (code >= 0xD800 and code <= 0xDFFF)) fail(pos);
            out.push_back(static_cast<char32_t>(code));
            pos += static_cast<size_t>(needed) + 1;
        }
        return out;
    }
}

std::u32string decode_utf8(const char* data, size_t len) {
    return decode(data, len);
}

std::u32string decode_utf8(const std::string& bytes) {
    return decode(bytes.data(), bytes.size());
}

std::u32string decode_utf8(const std::vector<uint8_t>& bytes) {
    return decode(bytes.data(), bytes.size());
}

void encode_utf8(uint32_t cp, std::string& out) {
    if (cp <= 0x7F) out.push_back(static_cast<char>(cp));
    else if (cp <= 0x7FF) {
        out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else if (cp <= 0xFFFF) {
        out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

std::string encode_utf8(const std::u32string& text) {
    std::string out;
    out.reserve(text.size());
    for (char32_t c : text) encode_utf8(static_cast<uint32_t>(c), out);
    return out;
}

}  // namespace jx
