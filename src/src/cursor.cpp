#include <jx/cursor.h>
#include <stdexcept>

namespace jx {

Result<char32_t> Cursor::next() {
    if (pending_) {
        char32_t c = *pending_;
        pending_.reset();
        return c;
    }
    if (pos_.index >= chars_.size())
        return error(ErrorKind::UnexpectedEnd, "unexpected end of input");

    char32_t c = chars_[pos_.index];
    prev_ = pos_;
    ++pos_.index;
    if (c == U'\n') {
        ++pos_.line;
        pos_.column = 0;
    } else {
        ++pos_.column;
    }
    return c;
}

void Cursor::put_back(char32_t c) {
    if (pending_) throw std::logic_error("put-back slot already holds a character");
    pending_ = c;
}

void Cursor::skip_whitespace() {
    while (not at_end()) {
        auto c = next();
        if (not c) return;
        if (not is_whitespace(*c)) {
            put_back(*c);
            return;
        }
    }
}

}  // namespace jx
