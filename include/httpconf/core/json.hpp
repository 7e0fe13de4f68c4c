#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <map>
#include <variant>
#include <optional>
#include <cstdint>

#include "httpconf/core/error.hpp"
#include "httpconf/util/expected.hpp"

namespace httpconf {

// ============================================================================
// JSON Value Type
// ============================================================================

class JsonValue;

using JsonNull = std::nullptr_t;
using JsonBool = bool;
using JsonNumber = double;
using JsonString = std::string;
using JsonArray = std::vector<JsonValue>;
using JsonObject = std::map<std::string, JsonValue>;

class JsonValue {
public:
    using Variant = std::variant<JsonNull, JsonBool, JsonNumber, JsonString, JsonArray, JsonObject>;

private:
    Variant value_;
    // Source text of a parsed number, empty otherwise
    std::string number_text_;

public:
    JsonValue() : value_(nullptr) {}
    JsonValue(std::nullptr_t) : value_(nullptr) {}
    JsonValue(bool b) : value_(b) {}
    JsonValue(int i) : value_(static_cast<double>(i)) {}
    JsonValue(int64_t i) : value_(static_cast<double>(i)) {}
    JsonValue(double d) : value_(d) {}
    JsonValue(const char* s) : value_(std::string(s)) {}
    JsonValue(std::string s) : value_(std::move(s)) {}
    JsonValue(std::string_view s) : value_(std::string(s)) {}
    JsonValue(JsonArray arr) : value_(std::move(arr)) {}
    JsonValue(JsonObject obj) : value_(std::move(obj)) {}

    // A number that remembers how it was written
    static JsonValue number(double d, std::string text) {
        JsonValue v(d);
        v.number_text_ = std::move(text);
        return v;
    }

    // Type checks
    bool is_null() const { return std::holds_alternative<JsonNull>(value_); }
    bool is_bool() const { return std::holds_alternative<JsonBool>(value_); }
    bool is_number() const { return std::holds_alternative<JsonNumber>(value_); }
    bool is_string() const { return std::holds_alternative<JsonString>(value_); }
    bool is_array() const { return std::holds_alternative<JsonArray>(value_); }
    bool is_object() const { return std::holds_alternative<JsonObject>(value_); }

    // Accessors (throw on type mismatch)
    bool as_bool() const { return std::get<JsonBool>(value_); }
    double as_number() const { return std::get<JsonNumber>(value_); }
    int64_t as_int() const { return static_cast<int64_t>(std::get<JsonNumber>(value_)); }
    const std::string& as_string() const { return std::get<JsonString>(value_); }
    const JsonArray& as_array() const { return std::get<JsonArray>(value_); }
    const JsonObject& as_object() const { return std::get<JsonObject>(value_); }
    // The number as written in the parsed text, or dump() when built in code
    std::string number_text() const { return number_text_.empty() ? dump() : number_text_; }
    JsonArray& as_array() { return std::get<JsonArray>(value_); }
    JsonObject& as_object() { return std::get<JsonObject>(value_); }

    // Object access
    JsonValue& operator[](const std::string& key) {
        if (!is_object()) {
            value_ = JsonObject{};
            number_text_.clear();
        }
        return std::get<JsonObject>(value_)[key];
    }

    const JsonValue* get(const std::string& key) const {
        if (!is_object()) return nullptr;
        auto& obj = std::get<JsonObject>(value_);
        auto it = obj.find(key);
        return it != obj.end() ? &it->second : nullptr;
    }

    bool contains(const std::string& key) const {
        if (!is_object()) return false;
        return std::get<JsonObject>(value_).count(key) > 0;
    }

    size_t size() const {
        if (is_array()) return std::get<JsonArray>(value_).size();
        if (is_object()) return std::get<JsonObject>(value_).size();
        return 0;
    }

    void push_back(JsonValue val) {
        if (!is_array()) {
            value_ = JsonArray{};
            number_text_.clear();
        }
        std::get<JsonArray>(value_).push_back(std::move(val));
    }

    // Name of the held type, for error messages ("string", "object", ...)
    std::string_view type_name() const noexcept;

    std::string dump(int indent = -1) const;

    bool operator==(const JsonValue& other) const { return value_ == other.value_; }
    bool operator!=(const JsonValue& other) const { return value_ != other.value_; }
};

// ============================================================================
// JSON Parsing
// ============================================================================

namespace json {

// Parse JSON text. Errors are BadValue with `origin` as the key.
expected<JsonValue, Error> parse(std::string_view json, std::string_view origin = "<json>");

std::string stringify(const JsonValue& value, int indent = -1);

inline std::string pretty(const JsonValue& value) {
    return stringify(value, 2);
}

} // namespace json

// ============================================================================
// JSON Builder (Fluent API)
// ============================================================================

class JsonBuilder {
    JsonValue root_;

public:
    JsonBuilder() : root_(JsonObject{}) {}

    JsonBuilder& set(const std::string& key, JsonValue value) {
        root_[key] = std::move(value);
        return *this;
    }

    JsonBuilder& set(const std::string& key, const char* value) {
        root_[key] = std::string(value);
        return *this;
    }

    template<typename T>
    JsonBuilder& set(const std::string& key, const std::optional<T>& value) {
        root_[key] = value ? JsonValue(*value) : JsonValue(nullptr);
        return *this;
    }

    template<typename T>
    JsonBuilder& set(const std::string& key, T value) {
        root_[key] = JsonValue(value);
        return *this;
    }

    JsonValue build() { return std::move(root_); }

    operator JsonValue() { return build(); }
};

inline JsonBuilder json_object() {
    return JsonBuilder();
}

} // namespace httpconf
