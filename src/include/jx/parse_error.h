#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace jx {

enum class ErrorKind {
    UnexpectedEnd,
    UnexpectedChar,
    InvalidLiteral,
    InvalidEscape,
    InvalidUnicodeEscape,
    ControlCharInString,
    NumberTooLong,
    InvalidIntegerSyntax,
    InvalidFloatSyntax,
    InvalidBase64Char,
    FormatNotSupported,
    TrailingContent,
    NestingTooDeep
};

const char* to_string(ErrorKind kind) noexcept;

// 0-based; index and column count Unicode scalar values
struct Position {
    size_t index = 0;
    size_t line = 0;
    size_t column = 0;

    bool operator==(const Position& o) const noexcept {
        return index == o.index and line == o.line and column == o.column;
    }
    bool operator!=(const Position& o) const noexcept { return not(*this == o); }
};

// A parse failure at a fixed point of the input. Immutable once built.
class ParseError {
public:
    ParseError(ErrorKind kind, std::string message, Position at,
               std::optional<Position> opened_at = std::nullopt)
        : kind_(kind), message_(std::move(message)), at_(at), opened_at_(opened_at) {}

    ErrorKind kind() const noexcept { return kind_; }
    const std::string& message() const noexcept { return message_; }
    const Position& position() const noexcept { return at_; }
    size_t index() const noexcept { return at_.index; }
    size_t line() const noexcept { return at_.line; }
    size_t column() const noexcept { return at_.column; }

    // where the innermost unclosed '[' or '{' was opened, when inside one
    const std::optional<Position>& opened_at() const noexcept { return opened_at_; }

    bool operator==(const ParseError& o) const noexcept {
        return kind_ == o.kind_ and message_ == o.message_ and at_ == o.at_ and opened_at_ == o.opened_at_;
    }
    bool operator!=(const ParseError& o) const noexcept { return not(*this == o); }

private:
    ErrorKind kind_;
    std::string message_;
    Position at_;
    std::optional<Position> opened_at_;
};

// Either a T or the ParseError that prevented it, never both.
template <typename T>
class Result {
public:
    Result(const T& value) : state_(std::in_place_index<0>, value) {}
    Result(T&& value) : state_(std::in_place_index<0>, std::move(value)) {}
    Result(const ParseError& error) : state_(std::in_place_index<1>, error) {}
    Result(ParseError&& error) : state_(std::in_place_index<1>, std::move(error)) {}

    bool ok() const noexcept { return state_.index() == 0; }
    explicit operator bool() const noexcept { return ok(); }

    const T& value() const& { return std::get<0>(state_); }
    T& value() & { return std::get<0>(state_); }
    T&& value() && { return std::get<0>(std::move(state_)); }

    const T& operator*() const& { return value(); }
    T& operator*() & { return value(); }
    T&& operator*() && { return std::move(*this).value(); }
    const T* operator->() const { return &value(); }

    const ParseError& error() const& { return std::get<1>(state_); }
    ParseError&& error() && { return std::get<1>(std::move(state_)); }

    bool operator==(const Result& o) const { return state_ == o.state_; }
    bool operator!=(const Result& o) const { return not(*this == o); }

private:
    std::variant<T, ParseError> state_;
};

// Thrown by the convenience parse_json() API; what() is the formatted error.
struct ParseException : public std::runtime_error {
    ParseError error;
    ParseException(ParseError e, const std::string& what)
        : std::runtime_error(what), error(std::move(e)) {}
};

// "message (line L, column C)", the offending source line and a caret under
// the failing column. Lines and columns are printed 1-based.
std::string format_error(const ParseError& error, const std::u32string& source);
std::string format_error(const ParseError& error, const std::string& utf8_source);

}  // namespace jx
