#include <jx/value.h>

namespace jx {

Value::Type Value::type() const noexcept {
    if (is_bool()) return Type::Boolean;
    if (is_int()) return Type::Integer;
    if (is_double()) return Type::Double;
    if (is_string()) return Type::String;
    if (is_list()) return Type::Array;
    if (is_dict()) return Type::Object;
    if (is_binary()) return Type::Binary;
    return Type::Null;
}

const char* Value::type_name() const noexcept {
    switch (type()) {
        case Type::Null: return "null";
        case Type::Boolean: return "boolean";
        case Type::Integer: return "integer";
        case Type::Double: return "double";
        case Type::String: return "string";
        case Type::Array: return "array";
        case Type::Object: return "object";
        case Type::Binary: return "binary";
    }
    return "unknown";
}

bool Value::operator==(const Value& o) const {
    if (v.index() != o.v.index()) return false;
    if (is_dict()) {
        const auto& a = std::get<dict_ptr>(v);
        const auto& b = std::get<dict_ptr>(o.v);
        if (a == b) return true;
        if (not a or not b) return false;
        return *a == *b;
    }
    // remaining alternatives compare by value (vectors recurse into this operator)
    return v == o.v;
}

const Value& Value::at(size_t idx) const {
    if (not is_list()) throw std::out_of_range("not an array");
    const auto& L = as_list();
    if (idx >= L.size()) throw std::out_of_range("index out of range");
    return L[idx];
}

const Value& Value::at(const key_type& k) const {
    if (not is_dict()) throw std::out_of_range("not an object");
    return as_dict().at(k);
}

size_t Value::size() const noexcept {
    if (is_list()) return std::get<list_t>(v).size();
    if (is_binary()) return std::get<Bytes>(v).size();
    if (is_dict()) {
        const auto& p = std::get<dict_ptr>(v);
        return p ? p->size() : 0;
    }
    return 0;
}

bool Value::has(const key_type& k) const {
    if (not is_dict()) return false;
    const auto& p = std::get<dict_ptr>(v);
    return p ? p->has(k) : false;
}

std::vector<Value::key_type> Value::keys() const {
    if (not is_dict()) throw std::runtime_error("not an object");
    return as_dict().keys();
}

}  // namespace jx
