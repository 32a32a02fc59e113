#include "json_value.hpp"

#include <algorithm>

namespace bridge::json {

const Value Value::NULL_VALUE;

Value Value::array(Array items) {
    Value value;
    value.type_ = Type::Array;
    value.array_ = std::move(items);
    return value;
}

Value Value::object(Object members) {
    Value value;
    value.type_ = Type::Object;
    for (auto& member : members) {
        value.set(std::move(member.first), std::move(member.second));
    }
    return value;
}

bool Value::as_bool(bool fallback) const {
    if (type_ == Type::Bool) {
        return bool_;
    }
    return fallback;
}

int64_t Value::as_int(int64_t fallback) const {
    if (type_ == Type::Int) {
        return int_;
    }
    if (type_ == Type::Double) {
        return static_cast<int64_t>(double_);
    }
    return fallback;
}

double Value::as_double(double fallback) const {
    if (type_ == Type::Double) {
        return double_;
    }
    if (type_ == Type::Int) {
        return static_cast<double>(int_);
    }
    return fallback;
}

std::string Value::as_string(const std::string& fallback) const {
    if (type_ == Type::String) {
        return string_;
    }
    return fallback;
}

size_t Value::size() const {
    if (type_ == Type::Array) {
        return array_.size();
    }
    if (type_ == Type::Object) {
        return object_.size();
    }
    return 0;
}

bool Value::contains(std::string_view key) const {
    return find(key) != nullptr;
}

const Value* Value::find(std::string_view key) const {
    if (type_ != Type::Object) {
        return nullptr;
    }
    for (const auto& member : object_) {
        if (member.first == key) {
            return &member.second;
        }
    }
    return nullptr;
}

Value* Value::find(std::string_view key) {
    return const_cast<Value*>(static_cast<const Value*>(this)->find(key));
}

Value& Value::set(std::string key, Value value) {
    if (type_ != Type::Object) {
        *this = object();
    }
    if (Value* existing = find(key)) {
        *existing = std::move(value);
        return *existing;
    }
    object_.emplace_back(std::move(key), std::move(value));
    return object_.back().second;
}

bool Value::erase(std::string_view key) {
    auto it = std::find_if(object_.begin(), object_.end(),
                           [key](const Member& member) { return member.first == key; });
    if (it == object_.end()) {
        return false;
    }
    object_.erase(it);
    return true;
}

void Value::push_back(Value value) {
    if (type_ != Type::Array) {
        *this = array();
    }
    array_.push_back(std::move(value));
}

const Value& Value::operator[](std::string_view key) const {
    const Value* found = find(key);
    return found ? *found : NULL_VALUE;
}

const Value& Value::operator[](size_t index) const {
    if (type_ != Type::Array || index >= array_.size()) {
        return NULL_VALUE;
    }
    return array_[index];
}

bool Value::operator==(const Value& other) const {
    if (type_ != other.type_) {
        return false;
    }

    switch (type_) {
        case Type::Null:
            return true;
        case Type::Bool:
            return bool_ == other.bool_;
        case Type::Int:
            return int_ == other.int_;
        case Type::Double:
            return double_ == other.double_;
        case Type::String:
            return string_ == other.string_;
        case Type::Array:
            return array_ == other.array_;
        case Type::Object:
            // Member order carries no meaning.
            if (object_.size() != other.object_.size()) {
                return false;
            }
            for (const auto& member : object_) {
                const Value* counterpart = other.find(member.first);
                if (!counterpart || *counterpart != member.second) {
                    return false;
                }
            }
            return true;
    }
    return false;
}

const char* Value::type_name(Type type) {
    switch (type) {
        case Type::Null: return "null";
        case Type::Bool: return "boolean";
        case Type::Int: return "integer";
        case Type::Double: return "number";
        case Type::String: return "string";
        case Type::Array: return "array";
        case Type::Object: return "object";
    }
    return "unknown";
}

} // namespace bridge::json
