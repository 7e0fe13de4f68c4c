#include "httpconf/core/json.hpp"

#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <charconv>

namespace httpconf {

// ============================================================================
// JSON Serialization
// ============================================================================

namespace {

void escape_string(std::ostream& os, std::string_view str) {
    os << '"';
    for (char c : str) {
        switch (c) {
            case '"':  os << "\\\""; break;
            case '\\': os << "\\\\"; break;
            case '\b': os << "\\b"; break;
            case '\f': os << "\\f"; break;
            case '\n': os << "\\n"; break;
            case '\r': os << "\\r"; break;
            case '\t': os << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    os << "\\u" << std::hex << std::setfill('0') << std::setw(4)
                       << static_cast<int>(static_cast<unsigned char>(c)) << std::dec;
                } else {
                    os << c;
                }
        }
    }
    os << '"';
}

void dump_impl(std::ostream& os, const JsonValue& value, int indent, int depth) {
    bool pretty = indent >= 0;
    std::string indent_str = pretty ? std::string(depth * indent, ' ') : "";
    std::string child_indent = pretty ? std::string((depth + 1) * indent, ' ') : "";

    if (value.is_null()) {
        os << "null";
    } else if (value.is_bool()) {
        os << (value.as_bool() ? "true" : "false");
    } else if (value.is_number()) {
        double num = value.as_number();
        if (std::isfinite(num)) {
            if (num == std::floor(num) && std::abs(num) < 1e15) {
                os << static_cast<int64_t>(num);
            } else {
                os << std::setprecision(17) << num;
            }
        } else {
            os << "null";  // JSON doesn't support inf/nan
        }
    } else if (value.is_string()) {
        escape_string(os, value.as_string());
    } else if (value.is_array()) {
        const auto& arr = value.as_array();
        if (arr.empty()) {
            os << "[]";
        } else {
            os << '[';
            if (pretty) os << '\n';
            for (size_t i = 0; i < arr.size(); ++i) {
                if (pretty) os << child_indent;
                dump_impl(os, arr[i], indent, depth + 1);
                if (i + 1 < arr.size()) os << ',';
                if (pretty) os << '\n';
            }
            if (pretty) os << indent_str;
            os << ']';
        }
    } else if (value.is_object()) {
        const auto& obj = value.as_object();
        if (obj.empty()) {
            os << "{}";
        } else {
            os << '{';
            if (pretty) os << '\n';
            size_t i = 0;
            for (const auto& [key, val] : obj) {
                if (pretty) os << child_indent;
                escape_string(os, key);
                os << ':';
                if (pretty) os << ' ';
                dump_impl(os, val, indent, depth + 1);
                if (++i < obj.size()) os << ',';
                if (pretty) os << '\n';
            }
            if (pretty) os << indent_str;
            os << '}';
        }
    }
}

} // anonymous namespace

std::string JsonValue::dump(int indent) const {
    std::ostringstream os;
    dump_impl(os, *this, indent, 0);
    return os.str();
}

std::string_view JsonValue::type_name() const noexcept {
    if (is_null()) return "null";
    if (is_bool()) return "boolean";
    if (is_number()) return "number";
    if (is_string()) return "string";
    if (is_array()) return "list";
    return "object";
}

// ============================================================================
// JSON Parsing
// ============================================================================

namespace {

class JsonParser {
    std::string_view input_;
    std::string origin_;
    size_t pos_ = 0;
    size_t line_ = 1;

public:
    JsonParser(std::string_view input, std::string_view origin)
        : input_(input), origin_(origin) {}

    expected<JsonValue, Error> parse() {
        skip_whitespace();
        auto result = parse_value();
        if (!result) return result;
        skip_whitespace();
        if (pos_ < input_.size()) {
            return fail("Unexpected characters after JSON value");
        }
        return result;
    }

private:
    unexpected<Error> fail(const std::string& what) const {
        return unexpected(Error::bad_value(origin_,
            what + " (line " + std::to_string(line_) + ")"));
    }

    char peek() const {
        return pos_ < input_.size() ? input_[pos_] : '\0';
    }

    char consume() {
        if (pos_ >= input_.size()) return '\0';
        char c = input_[pos_++];
        if (c == '\n') ++line_;
        return c;
    }

    bool consume_if(char c) {
        if (peek() == c) {
            consume();
            return true;
        }
        return false;
    }

    bool consume_if(std::string_view s) {
        if (input_.substr(pos_).starts_with(s)) {
            pos_ += s.size();
            return true;
        }
        return false;
    }

    void skip_whitespace() {
        while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_]))) {
            consume();
        }
    }

    expected<JsonValue, Error> parse_value() {
        skip_whitespace();

        char c = peek();
        if (c == 'n') return parse_null();
        if (c == 't' || c == 'f') return parse_bool();
        if (c == '"') return parse_string();
        if (c == '[') return parse_array();
        if (c == '{') return parse_object();
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parse_number();

        if (c == '\0') return fail("Unexpected end of JSON input");
        return fail("Unexpected character in JSON: '" + std::string(1, c) + "'");
    }

    expected<JsonValue, Error> parse_null() {
        if (consume_if("null")) {
            return JsonValue(nullptr);
        }
        return fail("Expected 'null'");
    }

    expected<JsonValue, Error> parse_bool() {
        if (consume_if("true")) {
            return JsonValue(true);
        }
        if (consume_if("false")) {
            return JsonValue(false);
        }
        return fail("Expected 'true' or 'false'");
    }

    expected<JsonValue, Error> parse_number() {
        size_t start = pos_;

        consume_if('-');

        if (peek() == '0') {
            consume();
        } else if (std::isdigit(static_cast<unsigned char>(peek()))) {
            while (std::isdigit(static_cast<unsigned char>(peek()))) {
                consume();
            }
        } else {
            return fail("Invalid number");
        }

        if (peek() == '.') {
            consume();
            if (!std::isdigit(static_cast<unsigned char>(peek()))) {
                return fail("Invalid number");
            }
            while (std::isdigit(static_cast<unsigned char>(peek()))) {
                consume();
            }
        }

        if (peek() == 'e' || peek() == 'E') {
            consume();
            if (!consume_if('+')) consume_if('-');
            if (!std::isdigit(static_cast<unsigned char>(peek()))) {
                return fail("Invalid number exponent");
            }
            while (std::isdigit(static_cast<unsigned char>(peek()))) {
                consume();
            }
        }

        std::string num_str(input_.substr(start, pos_ - start));
        try {
            return JsonValue::number(std::stod(num_str), num_str);
        } catch (const std::exception&) {
            return fail("Invalid number: " + num_str);
        }
    }

    expected<JsonValue, Error> parse_string() {
        if (!consume_if('"')) {
            return fail("Expected '\"'");
        }

        std::string result;
        while (peek() != '"') {
            if (pos_ >= input_.size()) {
                return fail("Unterminated string");
            }

            if (peek() == '\\') {
                consume();
                char esc = consume();
                switch (esc) {
                    case '"':  result += '"'; break;
                    case '\\': result += '\\'; break;
                    case '/':  result += '/'; break;
                    case 'b':  result += '\b'; break;
                    case 'f':  result += '\f'; break;
                    case 'n':  result += '\n'; break;
                    case 'r':  result += '\r'; break;
                    case 't':  result += '\t'; break;
                    case 'u': {
                        if (pos_ + 4 > input_.size()) {
                            return fail("Invalid unicode escape");
                        }
                        auto hex = input_.substr(pos_, 4);
                        unsigned codepoint = 0;
                        auto [ptr, ec] = std::from_chars(hex.data(), hex.data() + hex.size(), codepoint, 16);
                        if (ec != std::errc{} || ptr != hex.data() + hex.size()) {
                            return fail("Invalid unicode escape");
                        }
                        pos_ += 4;
                        if (codepoint < 0x80) {
                            result += static_cast<char>(codepoint);
                        } else if (codepoint < 0x800) {
                            result += static_cast<char>(0xC0 | (codepoint >> 6));
                            result += static_cast<char>(0x80 | (codepoint & 0x3F));
                        } else {
                            result += static_cast<char>(0xE0 | (codepoint >> 12));
                            result += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
                            result += static_cast<char>(0x80 | (codepoint & 0x3F));
                        }
                        break;
                    }
                    default:
                        return fail("Invalid escape sequence: \\" + std::string(1, esc));
                }
            } else {
                result += consume();
            }
        }

        consume();  // closing quote
        return JsonValue(std::move(result));
    }

    expected<JsonValue, Error> parse_array() {
        if (!consume_if('[')) {
            return fail("Expected '['");
        }

        JsonArray arr;
        skip_whitespace();

        if (consume_if(']')) {
            return JsonValue(std::move(arr));
        }

        while (true) {
            auto value = parse_value();
            if (!value) return value;
            arr.push_back(std::move(*value));

            skip_whitespace();
            if (consume_if(']')) {
                break;
            }
            if (!consume_if(',')) {
                return fail("Expected ',' or ']' in array");
            }
        }

        return JsonValue(std::move(arr));
    }

    expected<JsonValue, Error> parse_object() {
        if (!consume_if('{')) {
            return fail("Expected '{'");
        }

        JsonObject obj;
        skip_whitespace();

        if (consume_if('}')) {
            return JsonValue(std::move(obj));
        }

        while (true) {
            skip_whitespace();
            auto key = parse_string();
            if (!key) return key;

            skip_whitespace();
            if (!consume_if(':')) {
                return fail("Expected ':' after object key");
            }

            auto value = parse_value();
            if (!value) return value;

            obj[key->as_string()] = std::move(*value);

            skip_whitespace();
            if (consume_if('}')) {
                break;
            }
            if (!consume_if(',')) {
                return fail("Expected ',' or '}' in object");
            }
        }

        return JsonValue(std::move(obj));
    }
};

} // anonymous namespace

namespace json {

expected<JsonValue, Error> parse(std::string_view json, std::string_view origin) {
    if (json.empty()) {
        return unexpected(Error::bad_value(std::string(origin), "Empty JSON input"));
    }
    return JsonParser(json, origin).parse();
}

std::string stringify(const JsonValue& value, int indent) {
    return value.dump(indent);
}

} // namespace json

} // namespace httpconf
