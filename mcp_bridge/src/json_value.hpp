#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bridge::json {

/**
 * Dynamically typed JSON value.
 *
 * Integers and floating point numbers are kept apart so a parsed "2" and
 * "2.0" stay distinguishable. Objects keep their members in insertion order
 * and never hold the same key twice.
 */
class Value {
public:
    enum class Type {
        Null,
        Bool,
        Int,
        Double,
        String,
        Array,
        Object,
    };

    using Array = std::vector<Value>;
    using Member = std::pair<std::string, Value>;
    using Object = std::vector<Member>;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool value) : type_(Type::Bool), bool_(value) {}
    Value(int value) : type_(Type::Int), int_(value) {}
    Value(int64_t value) : type_(Type::Int), int_(value) {}
    Value(double value) : type_(Type::Double), double_(value) {}
    Value(const char* value) : type_(Type::String), string_(value ? value : "") {}
    Value(std::string value) : type_(Type::String), string_(std::move(value)) {}
    Value(std::string_view value) : type_(Type::String), string_(value) {}

    static Value array(Array items = {});
    static Value object(Object members = {});

    Type type() const { return type_; }

    bool is_null() const { return type_ == Type::Null; }
    bool is_bool() const { return type_ == Type::Bool; }
    bool is_int() const { return type_ == Type::Int; }
    bool is_double() const { return type_ == Type::Double; }
    bool is_number() const { return type_ == Type::Int || type_ == Type::Double; }
    bool is_string() const { return type_ == Type::String; }
    bool is_array() const { return type_ == Type::Array; }
    bool is_object() const { return type_ == Type::Object; }

    bool as_bool(bool fallback = false) const;
    int64_t as_int(int64_t fallback = 0) const;
    double as_double(double fallback = 0.0) const;
    std::string as_string(const std::string& fallback = "") const;

    // Only meaningful for strings; empty for every other type.
    const std::string& string_ref() const { return string_; }

    const Array& items() const { return array_; }
    Array& items() { return array_; }
    const Object& members() const { return object_; }

    /// Number of array items or object members, 0 for scalars.
    size_t size() const;

    bool contains(std::string_view key) const;
    const Value* find(std::string_view key) const;
    Value* find(std::string_view key);

    /// Inserts or replaces a member. A non-object value is reset to an empty object first.
    Value& set(std::string key, Value value);
    bool erase(std::string_view key);

    /// Appends an item. A non-array value is reset to an empty array first.
    void push_back(Value value);

    /// Member lookup returning the shared null value when absent.
    const Value& operator[](std::string_view key) const;
    const Value& operator[](size_t index) const;

    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

    static const char* type_name(Type type);

    static const Value NULL_VALUE;

private:
    Type type_ = Type::Null;
    bool bool_ = false;
    int64_t int_ = 0;
    double double_ = 0.0;
    std::string string_;
    Array array_;
    Object object_;
};

} // namespace bridge::json
