// jx::Value - the in-memory tree produced by the parser
#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace jx {

struct Object;  // forward

using Bytes = std::vector<std::uint8_t>;

struct Value {
    using list_t = std::vector<Value>;
    using dict_ptr = std::shared_ptr<Object>;
    using key_type = std::string;

    enum class Type { Null, Boolean, Integer, Double, String, Array, Object, Binary };

    std::variant<std::monostate, bool, int64_t, double, std::string, list_t, dict_ptr, Bytes> v;

    Value() = default;
    Value(bool b) : v(b) {}
    Value(int64_t x) : v(x) {}
    Value(int x) : v(int64_t(x)) {}
    Value(double x) : v(x) {}
    Value(const char* s) : v(std::string(s)) {}
    Value(const std::string& s) : v(s) {}
    Value(std::string&& s) : v(std::move(s)) {}
    Value(const list_t& l) : v(l) {}
    Value(list_t&& l) : v(std::move(l)) {}
    Value(const Bytes& b) : v(b) {}
    Value(Bytes&& b) : v(std::move(b)) {}
    Value(const Object& d);
    Value(Object&& d);

    bool is_null() const noexcept { return std::holds_alternative<std::monostate>(v); }
    bool is_bool() const noexcept { return std::holds_alternative<bool>(v); }
    bool is_int() const noexcept { return std::holds_alternative<int64_t>(v); }
    bool is_double() const noexcept { return std::holds_alternative<double>(v); }
    bool is_string() const noexcept { return std::holds_alternative<std::string>(v); }
    bool is_list() const noexcept { return std::holds_alternative<list_t>(v); }
    bool is_dict() const noexcept { return std::holds_alternative<dict_ptr>(v); }
    bool is_binary() const noexcept { return std::holds_alternative<Bytes>(v); }

    bool as_bool() const { return std::get<bool>(v); }
    int64_t as_int() const { return std::get<int64_t>(v); }
    double as_double() const { return std::get<double>(v); }
    const std::string& as_string() const { return std::get<std::string>(v); }
    const list_t& as_list() const { return std::get<list_t>(v); }
    const Object& as_dict() const;
    const Bytes& as_binary() const { return std::get<Bytes>(v); }

    Type type() const noexcept;
    const char* type_name() const noexcept;

    // deep comparison, object members compared by key
    bool operator==(const Value& o) const;
    bool operator!=(const Value& o) const { return not(*this == o); }

    const Value& at(size_t idx) const;
    const Value& at(const key_type& k) const;

    // element count for arrays, member count for objects, byte count for binary
    size_t size() const noexcept;

    bool has(const key_type& k) const;
    std::vector<key_type> keys() const;
};

struct Object {
    using key_type = std::string;
    using value_type = Value;
    using map_type = std::map<key_type, value_type>;

    map_type data;

    Object() = default;
    Object(std::initializer_list<std::pair<const key_type, value_type>> init) : data(init) {}

    // last write wins
    void set(const key_type& k, Value&& val) { data.insert_or_assign(k, std::move(val)); }

    bool has(const key_type& k) const noexcept { return data.find(k) != data.end(); }
    size_t size() const noexcept { return data.size(); }
    bool empty() const noexcept { return data.empty(); }

    const value_type& at(const key_type& k) const {
        auto it = data.find(k);
        if (it == data.end()) throw std::out_of_range("key not found: \"" + k + "\"");
        return it->second;
    }

    std::vector<key_type> keys() const {
        std::vector<key_type> out;
        out.reserve(data.size());
        for (auto const& p : data) out.push_back(p.first);
        return out;
    }

    bool operator==(const Object& rhs) const { return data == rhs.data; }
    bool operator!=(const Object& rhs) const { return not(*this == rhs); }
};

inline Value::Value(const Object& d) : v(std::make_shared<Object>(d)) {}
inline Value::Value(Object&& d) : v(std::make_shared<Object>(std::move(d))) {}

inline const Object& Value::as_dict() const {
    const auto& p = std::get<dict_ptr>(v);
    if (not p) throw std::logic_error("object value without storage");
    return *p;
}

}  // namespace jx
