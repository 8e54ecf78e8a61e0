#include <catch2/catch_test_macros.hpp>
#include <jx/cursor.h>
#include <stdexcept>

using namespace jx;

TEST_CASE("Cursor reads characters in order", "[cursor][unit]") {
    Cursor c(U"ab");
    REQUIRE_FALSE(c.at_end());
    REQUIRE(*c.next() == U'a');
    REQUIRE(*c.next() == U'b');
    REQUIRE(c.at_end());
    REQUIRE(c.position().index == 2);
}

TEST_CASE("Reading past the end fails with UnexpectedEnd", "[cursor][unit]") {
    Cursor c(U"x");
    REQUIRE(c.next().ok());
    auto r = c.next();
    REQUIRE_FALSE(r.ok());
    REQUIRE(r.error().kind() == ErrorKind::UnexpectedEnd);
    REQUIRE(r.error().index() == 1);

    Cursor empty(U"");
    REQUIRE(empty.at_end());
    REQUIRE_FALSE(empty.next().ok());
}

TEST_CASE("Newlines advance the line and reset the column", "[cursor][unit]") {
    Cursor c(U"a\nbc\n");
    c.next();
    REQUIRE(c.position().line == 0);
    REQUIRE(c.position().column == 1);
    c.next();
    REQUIRE(c.position().line == 1);
    REQUIRE(c.position().column == 0);
    c.next();
    c.next();
    REQUIRE(c.position().column == 2);
    c.next();
    REQUIRE(c.position() == Position{5, 2, 0});
}

TEST_CASE("Put back returns the same character next", "[cursor][unit]") {
    Cursor c(U"xy");
    auto x = c.next();
    c.put_back(*x);
    REQUIRE_FALSE(c.at_end());
    REQUIRE(*c.next() == U'x');
    REQUIRE(*c.next() == U'y');

    auto y = U'y';
    c.put_back(y);
    REQUIRE_FALSE(c.at_end());
    REQUIRE(*c.next() == U'y');
    REQUIRE(c.at_end());
}

TEST_CASE("Put back does not count as consumed", "[cursor][unit]") {
    Cursor c(U"a\nb");
    c.next();
    auto nl = c.next();
    REQUIRE(c.position() == Position{2, 1, 0});
    c.put_back(*nl);
    REQUIRE(c.position() == Position{1, 0, 1});
    c.next();
    REQUIRE(c.position() == Position{2, 1, 0});
}

TEST_CASE("A second put back is an internal error", "[cursor][unit][exception]") {
    Cursor c(U"ab");
    auto a = c.next();
    c.put_back(*a);
    REQUIRE_THROWS_AS(c.put_back(*a), std::logic_error);
}

TEST_CASE("skip_whitespace stops at the first significant character", "[cursor][unit]") {
    Cursor c(U" \t\r\n  x ");
    c.skip_whitespace();
    REQUIRE(c.position() == Position{6, 1, 2});
    REQUIRE(*c.next() == U'x');
    c.skip_whitespace();
    REQUIRE(c.at_end());
    REQUIRE(c.position().index == 8);

    Cursor none(U"x");
    none.skip_whitespace();
    REQUIRE(none.position().index == 0);
    REQUIRE(*none.next() == U'x');
}

TEST_CASE("Errors snapshot the current position", "[cursor][unit]") {
    Cursor c(U"ab\ncd");
    c.next();
    c.next();
    c.next();
    auto e = c.error(ErrorKind::UnexpectedChar, "boom");
    REQUIRE(e.message() == "boom");
    REQUIRE(e.index() == 3);
    REQUIRE(e.line() == 1);
    REQUIRE(e.column() == 0);

    auto d = c.next();
    auto r = c.reject(*d, ErrorKind::UnexpectedChar, "bad");
    REQUIRE(r.index() == 3);
}
