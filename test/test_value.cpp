#include <catch2/catch_test_macros.hpp>
#include <jx/json.h>
#include <stdexcept>

using namespace jx;

TEST_CASE("Value kinds", "[value][unit]") {
    REQUIRE(Value().is_null());
    REQUIRE(Value(true).is_bool());
    REQUIRE(Value(3).is_int());
    REQUIRE(Value(2.5).is_double());
    REQUIRE(Value("s").is_string());
    REQUIRE(Value(Value::list_t{1, 2}).is_list());
    REQUIRE(Value(Object{{"a", 1}}).is_dict());
    REQUIRE(Value(Bytes{1, 2, 3}).is_binary());

    REQUIRE(Value(Bytes{}).type() == Value::Type::Binary);
    REQUIRE(std::string(Value().type_name()) == "null");
    REQUIRE(std::string(Value(Object{}).type_name()) == "object");
}

TEST_CASE("Deep equality", "[value][unit]") {
    Value a = Object{{"x", Value::list_t{1, "two", Value()}}, {"y", Bytes{9}}};
    Value b = Object{{"y", Bytes{9}}, {"x", Value::list_t{1, "two", Value()}}};
    REQUIRE(a == b);

    Value c = Object{{"x", Value::list_t{1, "two"}}, {"y", Bytes{9}}};
    REQUIRE(a != c);

    REQUIRE(Value(1) != Value(1.0));
    REQUIRE(Value("1") != Value(1));
    REQUIRE(Value(Bytes{'a'}) != Value("a"));
}

TEST_CASE("Object member access", "[value][unit]") {
    Object o;
    o.set("k", Value(1));
    o.set("k", Value(2));
    REQUIRE(o.size() == 1);
    REQUIRE(o.at("k").as_int() == 2);
    REQUIRE_THROWS_AS(o.at("missing"), std::out_of_range);

    Value v = std::move(o);
    REQUIRE(v.has("k"));
    REQUIRE_FALSE(v.has("missing"));
    REQUIRE(v.keys() == std::vector<std::string>{"k"});
    REQUIRE(v.size() == 1);
}

TEST_CASE("Indexing the wrong kind of value throws", "[value][unit][exception]") {
    Value list = Value::list_t{1};
    REQUIRE(list.at(0).as_int() == 1);
    REQUIRE_THROWS(list.at(1));
    REQUIRE_THROWS(list.at("k"));
    REQUIRE_THROWS(Value(5).keys());
    REQUIRE_THROWS_AS(Value(5).as_string(), std::bad_variant_access);
    REQUIRE_FALSE(Value(5).has("k"));
}
