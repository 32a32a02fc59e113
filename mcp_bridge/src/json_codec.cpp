#include "json_codec.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <initializer_list>
#include <iomanip>
#include <limits>
#include <locale>
#include <sstream>
#include <unordered_set>

namespace bridge::json {

namespace {

constexpr int MAX_NESTING_DEPTH = 512;

class Parser {
public:
    explicit Parser(std::string_view text) : text_(text) {}

    bool parse_document(Value& out) {
        skip_whitespace();
        if (pos_ >= text_.size()) {
            return false;
        }
        return parse_value(out, 0);
    }

private:
    bool parse_value(Value& out, int depth) {
        if (depth > MAX_NESTING_DEPTH) {
            return false;
        }

        skip_whitespace();
        if (pos_ >= text_.size()) {
            return false;
        }

        char c = text_[pos_];
        switch (c) {
            case '{':
                return parse_object(out, depth);
            case '[':
                return parse_array(out, depth);
            case '"': {
                std::string str;
                if (!parse_string(str)) {
                    return false;
                }
                out = Value(std::move(str));
                return true;
            }
            case 't':
                return parse_literal("true", Value(true), out);
            case 'f':
                return parse_literal("false", Value(false), out);
            case 'n':
                return parse_literal("null", Value(), out);
            default:
                if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
                    return parse_number(out);
                }
                return false;
        }
    }

    bool parse_object(Value& out, int depth) {
        ++pos_; // '{'
        Value object = Value::object();

        skip_whitespace();
        if (pos_ < text_.size() && text_[pos_] == '}') {
            ++pos_;
            out = std::move(object);
            return true;
        }

        while (true) {
            skip_whitespace();
            if (pos_ >= text_.size() || text_[pos_] != '"') {
                return false;
            }

            std::string key;
            if (!parse_string(key)) {
                return false;
            }

            skip_whitespace();
            if (pos_ >= text_.size() || text_[pos_] != ':') {
                return false;
            }
            ++pos_;

            Value member;
            if (!parse_value(member, depth + 1)) {
                return false;
            }
            // Duplicate keys: the last occurrence wins.
            object.set(std::move(key), std::move(member));

            skip_whitespace();
            if (pos_ >= text_.size()) {
                return false;
            }
            if (text_[pos_] == ',') {
                ++pos_;
                continue;
            }
            if (text_[pos_] == '}') {
                ++pos_;
                out = std::move(object);
                return true;
            }
            return false;
        }
    }

    bool parse_array(Value& out, int depth) {
        ++pos_; // '['
        Value array = Value::array();

        skip_whitespace();
        if (pos_ < text_.size() && text_[pos_] == ']') {
            ++pos_;
            out = std::move(array);
            return true;
        }

        while (true) {
            Value item;
            if (!parse_value(item, depth + 1)) {
                return false;
            }
            array.push_back(std::move(item));

            skip_whitespace();
            if (pos_ >= text_.size()) {
                return false;
            }
            if (text_[pos_] == ',') {
                ++pos_;
                continue;
            }
            if (text_[pos_] == ']') {
                ++pos_;
                out = std::move(array);
                return true;
            }
            return false;
        }
    }

    bool parse_string(std::string& out) {
        ++pos_; // opening quote
        while (pos_ < text_.size()) {
            char c = text_[pos_++];
            if (c == '"') {
                return true;
            }
            if (c != '\\') {
                out += c;
                continue;
            }

            if (pos_ >= text_.size()) {
                return false;
            }
            char escaped = text_[pos_++];
            switch (escaped) {
                case 'n': out += '\n'; break;
                case 'r': out += '\r'; break;
                case 't': out += '\t'; break;
                case 'b': out += '\b'; break;
                case 'f': out += '\f'; break;
                case 'u':
                    if (!parse_unicode_escape(out)) {
                        return false;
                    }
                    break;
                default:
                    // '"', '\\', '/' and unknown escapes keep the character itself.
                    out += escaped;
                    break;
            }
        }
        return false; // unterminated
    }

    bool read_hex4(uint32_t& code) {
        if (pos_ + 4 > text_.size()) {
            return false;
        }
        code = 0;
        for (int i = 0; i < 4; ++i) {
            char h = text_[pos_++];
            code <<= 4;
            if (h >= '0' && h <= '9') {
                code |= static_cast<uint32_t>(h - '0');
            } else if (h >= 'a' && h <= 'f') {
                code |= static_cast<uint32_t>(h - 'a' + 10);
            } else if (h >= 'A' && h <= 'F') {
                code |= static_cast<uint32_t>(h - 'A' + 10);
            } else {
                return false;
            }
        }
        return true;
    }

    bool parse_unicode_escape(std::string& out) {
        uint32_t code = 0;
        if (!read_hex4(code)) {
            return false;
        }

        // High surrogate followed by "\uDC00".."\uDFFF" forms one code point.
        if (code >= 0xD800 && code <= 0xDBFF && pos_ + 6 <= text_.size() &&
            text_[pos_] == '\\' && text_[pos_ + 1] == 'u') {
            size_t saved = pos_;
            pos_ += 2;
            uint32_t low = 0;
            if (read_hex4(low) && low >= 0xDC00 && low <= 0xDFFF) {
                code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
            } else {
                pos_ = saved;
            }
        }

        append_utf8(out, code);
        return true;
    }

    static void append_utf8(std::string& out, uint32_t code) {
        if (code < 0x80) {
            out += static_cast<char>(code);
        } else if (code < 0x800) {
            out += static_cast<char>(0xC0 | (code >> 6));
            out += static_cast<char>(0x80 | (code & 0x3F));
        } else if (code < 0x10000) {
            out += static_cast<char>(0xE0 | (code >> 12));
            out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (code & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (code >> 18));
            out += static_cast<char>(0x80 | ((code >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (code & 0x3F));
        }
    }

    bool parse_number(Value& out) {
        size_t start = pos_;
        if (text_[pos_] == '-') {
            ++pos_;
        }

        size_t digits_start = pos_;
        while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
        if (pos_ == digits_start) {
            return false;
        }

        bool is_float = false;
        if (pos_ < text_.size() && text_[pos_] == '.') {
            is_float = true;
            ++pos_;
            size_t fraction_start = pos_;
            while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
                ++pos_;
            }
            if (pos_ == fraction_start) {
                return false;
            }
        }

        if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
            is_float = true;
            ++pos_;
            if (pos_ < text_.size() && (text_[pos_] == '+' || text_[pos_] == '-')) {
                ++pos_;
            }
            size_t exponent_start = pos_;
            while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
                ++pos_;
            }
            if (pos_ == exponent_start) {
                return false;
            }
        }

        std::string_view literal = text_.substr(start, pos_ - start);

        if (!is_float) {
            int64_t integer = 0;
            auto [end, ec] = std::from_chars(literal.data(), literal.data() + literal.size(), integer);
            if (ec == std::errc() && end == literal.data() + literal.size()) {
                out = Value(integer);
                return true;
            }
            // Out of int64 range: fall through to floating point.
        }

        double number = 0.0;
        auto [end, ec] = std::from_chars(literal.data(), literal.data() + literal.size(), number);
        if (ec == std::errc::result_out_of_range) {
            number = out_of_range_double(literal);
        } else if (ec != std::errc() || end != literal.data() + literal.size()) {
            return false;
        }
        out = Value(number);
        return true;
    }

    // Overflow saturates to infinity, underflow flushes to zero; the sign is kept.
    static double out_of_range_double(std::string_view literal) {
        const bool negative = literal.front() == '-';
        const size_t exponent = literal.find_first_of("eE");
        const bool underflow = exponent != std::string_view::npos && exponent + 1 < literal.size() &&
                               literal[exponent + 1] == '-';
        double magnitude = underflow ? 0.0 : std::numeric_limits<double>::infinity();
        return negative ? -magnitude : magnitude;
    }

    bool parse_literal(std::string_view word, Value value, Value& out) {
        if (text_.substr(pos_, word.size()) != word) {
            return false;
        }
        pos_ += word.size();
        out = std::move(value);
        return true;
    }

    void skip_whitespace() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    std::string_view text_;
    size_t pos_ = 0;
};

} // namespace

std::optional<Value> parse(std::string_view text) {
    Parser parser(text);
    Value value;
    if (!parser.parse_document(value)) {
        return std::nullopt;
    }
    return value;
}

JsonWriter::JsonWriter() {
    buffer_.reserve(256);
}

void JsonWriter::write_separator() {
    if (needs_comma_) {
        buffer_ += ',';
    }
    needs_comma_ = true;
}

void JsonWriter::write_quoted(std::string_view str) {
    buffer_ += '"';
    escape_string(buffer_, str);
    buffer_ += '"';
}

void JsonWriter::start_object() {
    write_separator();
    buffer_ += '{';
    needs_comma_ = false;
}

void JsonWriter::end_object() {
    buffer_ += '}';
    needs_comma_ = true;
}

void JsonWriter::start_array() {
    write_separator();
    buffer_ += '[';
    needs_comma_ = false;
}

void JsonWriter::end_array() {
    buffer_ += ']';
    needs_comma_ = true;
}

void JsonWriter::key(std::string_view key) {
    write_separator();
    write_quoted(key);
    buffer_ += ':';
    needs_comma_ = false;
}

void JsonWriter::null() {
    write_separator();
    buffer_ += "null";
}

void JsonWriter::boolean(bool value) {
    write_separator();
    buffer_ += value ? "true" : "false";
}

void JsonWriter::integer(int64_t value) {
    write_separator();
    buffer_ += std::to_string(value);
}

void JsonWriter::unsigned_integer(uint64_t value) {
    write_separator();
    buffer_ += std::to_string(value);
}

void JsonWriter::number(double value) {
    write_separator();
    format_double(buffer_, value);
}

void JsonWriter::string(std::string_view value) {
    write_separator();
    write_quoted(value);
}

void JsonWriter::raw(std::string_view json) {
    write_separator();
    buffer_.append(json);
}

void JsonWriter::value(const Value& value) {
    switch (value.type()) {
        case Value::Type::Null:
            null();
            break;
        case Value::Type::Bool:
            boolean(value.as_bool());
            break;
        case Value::Type::Int:
            integer(value.as_int());
            break;
        case Value::Type::Double:
            number(value.as_double());
            break;
        case Value::Type::String:
            string(value.string_ref());
            break;
        case Value::Type::Array:
            start_array();
            for (const auto& item : value.items()) {
                this->value(item);
            }
            end_array();
            break;
        case Value::Type::Object:
            start_object();
            for (const auto& [name, member] : value.members()) {
                key(name);
                this->value(member);
            }
            end_object();
            break;
    }
}

std::string JsonWriter::take_output() {
    std::string out = std::move(buffer_);
    buffer_.clear();
    needs_comma_ = false;
    return out;
}

void JsonWriter::escape_string(std::string& out, std::string_view str) {
    static const char HEX[] = "0123456789abcdef";
    for (char c : str) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"': out += "\\\""; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += "\\u00";
                    out += HEX[(c >> 4) & 0x0F];
                    out += HEX[c & 0x0F];
                } else {
                    out += c;
                }
                break;
        }
    }
}

void JsonWriter::format_double(std::string& out, double value) {
    if (!std::isfinite(value)) {
        out += "null";
        return;
    }

    std::string text;
    for (int precision : {15, 17}) {
        std::ostringstream stream;
        stream.imbue(std::locale::classic());
        stream << std::setprecision(precision) << value;
        text = stream.str();

        std::istringstream check{text};
        check.imbue(std::locale::classic());
        double reparsed = 0.0;
        check >> reparsed;
        if (reparsed == value) {
            break;
        }
    }

    // Keep the value recognisable as floating point when read back.
    if (text.find_first_of(".eE") == std::string::npos) {
        text += ".0";
    }
    out += text;
}

void RecordWriter::finish(JsonWriter& out) const {
    std::unordered_set<std::string> emitted;
    out.start_object();
    for (const auto& entry : properties_) {
        if (!emitted.insert(entry.name).second) {
            continue;
        }
        out.key(entry.name);
        out.raw(entry.json);
    }
    for (const auto& entry : fields_) {
        if (!emitted.insert(entry.name).second) {
            continue;
        }
        out.key(entry.name);
        out.raw(entry.json);
    }
    out.end_object();
}

std::string RecordWriter::strip_sentinel(std::string_view name) {
    if (name.size() > 1 && name.front() == '@') {
        name.remove_prefix(1);
    } else if (name.size() > 1 && name.back() == '_') {
        name.remove_suffix(1);
    }
    return std::string(name);
}

} // namespace bridge::json
