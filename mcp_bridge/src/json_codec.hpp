#pragma once

#include "json_value.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace bridge::json {

/// Parses JSON text. Returns std::nullopt on malformed input; never throws.
/// Content after the top-level value is ignored.
std::optional<Value> parse(std::string_view text);

/// Already serialized JSON, spliced verbatim into an enclosing document.
struct RawJson {
    std::string text;
};

/// Streaming JSON text writer.
class JsonWriter {
public:
    JsonWriter();

    void start_object();
    void end_object();
    void start_array();
    void end_array();

    void key(std::string_view key);

    void null();
    void boolean(bool value);
    void integer(int64_t value);
    void unsigned_integer(uint64_t value);
    void number(double value);
    void string(std::string_view value);
    void raw(std::string_view json);
    void value(const Value& value);

    const std::string& output() const { return buffer_; }
    std::string take_output();

    static void escape_string(std::string& out, std::string_view str);
    static void format_double(std::string& out, double value);

private:
    void write_separator();
    void write_quoted(std::string_view str);

    std::string buffer_;
    bool needs_comma_ = false;
};

class RecordWriter;

namespace detail {

template <typename T, typename = void>
struct is_record : std::false_type {};

template <typename T>
struct is_record<T, std::void_t<decltype(std::declval<const T&>().describe(std::declval<RecordWriter&>()))>>
    : std::true_type {};

template <typename T>
struct is_optional : std::false_type {};

template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};

template <typename T>
struct is_vector : std::false_type {};

template <typename T, typename A>
struct is_vector<std::vector<T, A>> : std::true_type {};

template <typename T>
struct is_string_map : std::false_type {};

template <typename T, typename C, typename A>
struct is_string_map<std::map<std::string, T, C, A>> : std::true_type {};

} // namespace detail

template <typename T>
void write_value(JsonWriter& out, const T& value);

/**
 * Serializer for structured records.
 *
 * A record type exposes `void describe(RecordWriter&) const` and declares its
 * accessor-style members with property() and its plain data members with
 * field(). On finish(), properties are written first, then fields whose name
 * no property already used. Absent members (empty optional, null Value) are
 * left out unless declared with Emit::Always.
 *
 * Member names may carry a reserved-word sentinel, a leading '@' or a trailing
 * '_' (as in `enum_`), which is stripped from the emitted key.
 */
class RecordWriter {
public:
    enum class Emit {
        SkipAbsent,
        Always,
    };

    template <typename T>
    void property(std::string_view name, const T& value, Emit emit = Emit::SkipAbsent) {
        add(properties_, name, value, emit);
    }

    template <typename T>
    void field(std::string_view name, const T& value, Emit emit = Emit::SkipAbsent) {
        add(fields_, name, value, emit);
    }

    void finish(JsonWriter& out) const;

    static std::string strip_sentinel(std::string_view name);

private:
    struct Entry {
        std::string name;
        std::string json;
    };

    template <typename T>
    static bool is_absent(const T& value) {
        if constexpr (detail::is_optional<T>::value) {
            return !value.has_value();
        } else if constexpr (std::is_same_v<T, Value>) {
            return value.is_null();
        } else if constexpr (std::is_pointer_v<T>) {
            return value == nullptr;
        } else {
            return false;
        }
    }

    template <typename T>
    void add(std::vector<Entry>& target, std::string_view name, const T& value, Emit emit) {
        if (emit == Emit::SkipAbsent && is_absent(value)) {
            return;
        }
        JsonWriter out;
        write_value(out, value);
        target.push_back({strip_sentinel(name), out.take_output()});
    }

    std::vector<Entry> properties_;
    std::vector<Entry> fields_;
};

template <typename T>
void write_value(JsonWriter& out, const T& value) {
    if constexpr (std::is_same_v<T, Value>) {
        out.value(value);
    } else if constexpr (std::is_same_v<T, RawJson>) {
        out.raw(value.text);
    } else if constexpr (std::is_same_v<T, std::string> || std::is_same_v<T, std::string_view>) {
        out.string(value);
    } else if constexpr (std::is_same_v<std::decay_t<T>, const char*> || std::is_same_v<std::decay_t<T>, char*>) {
        if (value) {
            out.string(value);
        } else {
            out.null();
        }
    } else if constexpr (std::is_same_v<T, std::nullptr_t>) {
        out.null();
    } else if constexpr (std::is_same_v<T, bool>) {
        out.boolean(value);
    } else if constexpr (std::is_integral_v<T> && std::is_signed_v<T>) {
        out.integer(static_cast<int64_t>(value));
    } else if constexpr (std::is_integral_v<T>) {
        out.unsigned_integer(static_cast<uint64_t>(value));
    } else if constexpr (std::is_floating_point_v<T>) {
        out.number(static_cast<double>(value));
    } else if constexpr (detail::is_optional<T>::value) {
        if (value) {
            write_value(out, *value);
        } else {
            out.null();
        }
    } else if constexpr (detail::is_vector<T>::value) {
        out.start_array();
        for (const auto& item : value) {
            write_value(out, item);
        }
        out.end_array();
    } else if constexpr (detail::is_string_map<T>::value) {
        out.start_object();
        for (const auto& [key, item] : value) {
            out.key(key);
            write_value(out, item);
        }
        out.end_object();
    } else if constexpr (detail::is_record<T>::value) {
        RecordWriter record;
        value.describe(record);
        record.finish(out);
    } else {
        static_assert(detail::is_record<T>::value, "type has no JSON representation");
    }
}

/// Serializes a Value, scalar, container or record to JSON text.
template <typename T>
std::string serialize(const T& value) {
    JsonWriter out;
    write_value(out, value);
    return out.take_output();
}

} // namespace bridge::json
