#pragma once

#include <jx/parse_error.h>
#include <optional>
#include <string>

namespace jx {

// Reads a fully materialized document one scalar value at a time, with a
// single character of put-back. Position counters only ever reflect
// characters that are consumed: putting a character back rewinds the
// reported position to just before it.
class Cursor {
public:
    explicit Cursor(std::u32string text) : chars_(std::move(text)) {}

    // Next character, taken from the put-back slot first. Fails with
    // UnexpectedEnd when the input is exhausted.
    Result<char32_t> next();

    // Un-read the character returned by the last next(). Throws
    // std::logic_error if the slot is already occupied.
    void put_back(char32_t c);

    bool at_end() const noexcept { return not pending_ and pos_.index >= chars_.size(); }

    // Consume space, tab, CR and LF; the first other character is put back.
    void skip_whitespace();

    Position position() const noexcept { return pending_ ? prev_ : pos_; }
    size_t length() const noexcept { return chars_.size(); }

    ParseError error(ErrorKind kind, const std::string& message,
                     std::optional<Position> opened_at = std::nullopt) const {
        return ParseError(kind, message, position(), opened_at);
    }

    // Error located at c, the character just read. Leaves c in the put-back
    // slot, so the cursor must not be read from afterwards.
    ParseError reject(char32_t c, ErrorKind kind, const std::string& message,
                      std::optional<Position> opened_at = std::nullopt) {
        put_back(c);
        return error(kind, message, opened_at);
    }

    static bool is_whitespace(char32_t c) noexcept {
        return c == U' ' or c == U'\t' or c == U'\r' or c == U'\n';
    }

private:
    std::u32string chars_;
    Position pos_;
    Position prev_;
    std::optional<char32_t> pending_;
};

}  // namespace jx
