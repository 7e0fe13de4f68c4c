#include "httpconf/config/configuration.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <fstream>
#include <iterator>
#include <sstream>

namespace httpconf {

namespace {

std::vector<std::string_view> split_path(std::string_view path) {
    std::vector<std::string_view> segments;
    size_t start = 0;
    while (start <= path.size()) {
        size_t dot = path.find('.', start);
        if (dot == std::string_view::npos) {
            dot = path.size();
        }
        segments.push_back(path.substr(start, dot - start));
        start = dot + 1;
    }
    return segments;
}

// Deep merge; values from `from` replace those in `into` except that two
// objects are merged key by key.
void merge_into(JsonValue& into, const JsonValue& from) {
    if (into.is_object() && from.is_object()) {
        for (const auto& [key, value] : from.as_object()) {
            auto& slot = into[key];
            if (slot.is_object() && value.is_object()) {
                merge_into(slot, value);
            } else {
                slot = value;
            }
        }
        return;
    }
    into = from;
}

// {"a.b": 1} -> {"a": {"b": 1}}
JsonValue expand_dotted(const JsonValue& value) {
    if (!value.is_object()) {
        return value;
    }

    JsonValue result(JsonObject{});
    for (const auto& [key, child] : value.as_object()) {
        JsonValue nested = expand_dotted(child);
        auto segments = split_path(key);
        for (auto it = segments.rbegin(); it != std::prev(segments.rend()); ++it) {
            JsonValue wrapper(JsonObject{});
            wrapper[std::string(*it)] = std::move(nested);
            nested = std::move(wrapper);
        }
        JsonValue single(JsonObject{});
        single[std::string(segments.front())] = std::move(nested);
        merge_into(result, single);
    }
    return result;
}

const JsonValue* walk(const JsonValue& root, std::string_view path) {
    const JsonValue* node = &root;
    for (auto segment : split_path(path)) {
        if (!node->is_object()) return nullptr;
        node = node->get(std::string(segment));
        if (!node) return nullptr;
    }
    return node;
}

unexpected<Error> wrong_type(const std::string& key, const JsonValue& v, std::string_view wanted) {
    return unexpected(Error::bad_value(key,
        "has type " + std::string(v.type_name()) + " rather than " + std::string(wanted)));
}

// [-2^63, 2^63): the doubles that convert to int64_t without overflow
bool fits_int64(double d) {
    constexpr double kLimit = 9223372036854775808.0;
    return d >= -kLimit && d < kLimit;
}

unexpected<Error> out_of_range(const std::string& key, const JsonValue& v) {
    return unexpected(Error::bad_value(key, v.dump() + " is out of range"));
}

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // anonymous namespace

// ============================================================================
// Value Conversions
// ============================================================================

expected<std::string, Error> ConfigValue<std::string>::convert(const JsonValue& v, const std::string& key) {
    if (v.is_string()) return v.as_string();
    if (v.is_number()) return v.number_text();
    if (v.is_bool()) return v.dump();
    return wrong_type(key, v, "string");
}

expected<bool, Error> ConfigValue<bool>::convert(const JsonValue& v, const std::string& key) {
    if (v.is_bool()) return v.as_bool();
    if (v.is_string()) {
        auto s = lower(v.as_string());
        if (s == "true" || s == "yes" || s == "on") return true;
        if (s == "false" || s == "no" || s == "off") return false;
        return unexpected(Error::bad_value(key, "'" + v.as_string() + "' is not a boolean"));
    }
    return wrong_type(key, v, "boolean");
}

expected<int64_t, Error> ConfigValue<int64_t>::convert(const JsonValue& v, const std::string& key) {
    if (v.is_number()) {
        double d = v.as_number();
        if (d != std::floor(d)) {
            return unexpected(Error::bad_value(key, v.dump() + " is not a whole number"));
        }
        if (!fits_int64(d)) return out_of_range(key, v);
        return static_cast<int64_t>(d);
    }
    if (v.is_string()) {
        const auto& s = v.as_string();
        int64_t value = 0;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
        if (ec == std::errc{} && ptr == s.data() + s.size()) {
            return value;
        }
        return unexpected(Error::bad_value(key, "'" + s + "' is not a number"));
    }
    return wrong_type(key, v, "number");
}

expected<double, Error> ConfigValue<double>::convert(const JsonValue& v, const std::string& key) {
    if (v.is_number()) return v.as_number();
    if (v.is_string()) {
        const auto& s = v.as_string();
        double value = 0;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
        if (ec == std::errc{} && ptr == s.data() + s.size()) {
            return value;
        }
        return unexpected(Error::bad_value(key, "'" + s + "' is not a number"));
    }
    return wrong_type(key, v, "number");
}

expected<MemorySize, Error> ConfigValue<MemorySize>::convert(const JsonValue& v, const std::string& key) {
    if (v.is_number()) {
        double d = v.as_number();
        if (d < 0 || d != std::floor(d)) {
            return unexpected(Error::bad_value(key, v.dump() + " is not a valid memory size"));
        }
        if (!fits_int64(d)) return out_of_range(key, v);
        return MemorySize{static_cast<int64_t>(d)};
    }
    if (v.is_string()) {
        auto size = units::parse_memory_size(v.as_string());
        if (!size) {
            return unexpected(Error::bad_value(key, size.error()));
        }
        return *size;
    }
    return wrong_type(key, v, "memory size");
}

expected<std::chrono::nanoseconds, Error> convert_duration(const JsonValue& v, const std::string& key) {
    if (v.is_number()) {
        // Bare numbers are milliseconds
        double nanos = std::round(v.as_number() * 1e6);
        if (!fits_int64(nanos)) return out_of_range(key, v);
        return std::chrono::nanoseconds(static_cast<int64_t>(nanos));
    }
    if (v.is_string()) {
        auto d = units::parse_duration(v.as_string());
        if (!d) {
            return unexpected(Error::bad_value(key, d.error()));
        }
        return *d;
    }
    return wrong_type(key, v, "duration");
}

// ============================================================================
// Configuration
// ============================================================================

Configuration::Configuration(JsonValue root) {
    if (root.is_null()) {
        root = JsonObject{};
    }
    layers_.push_back(expand_dotted(root));
}

expected<Configuration, Error> Configuration::parse(std::string_view text, std::string_view origin) {
    auto root = json::parse(text, origin);
    if (!root) {
        return unexpected(root.error());
    }
    if (!root->is_object()) {
        return unexpected(Error::bad_value(std::string(origin),
            "Top-level value must be an object, got " + std::string(root->type_name())));
    }
    return Configuration(std::move(*root));
}

expected<Configuration, Error> Configuration::load_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected(Error::bad_value(path.string(), "Cannot open configuration file"));
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return parse(contents.str(), path.string());
}

Configuration Configuration::from_pairs(std::vector<std::pair<std::string, JsonValue>> pairs) {
    JsonValue root(JsonObject{});
    for (auto& [key, value] : pairs) {
        root[key] = std::move(value);
    }
    return Configuration(std::move(root));
}

Configuration Configuration::with_fallback(const Configuration& fallback) const {
    Configuration result;
    result.layers_ = layers_;
    result.layers_.insert(result.layers_.end(), fallback.layers_.begin(), fallback.layers_.end());
    return result;
}

const JsonValue* Configuration::find(std::string_view path) const {
    for (const auto& layer : layers_) {
        if (const JsonValue* value = walk(layer, path)) {
            return value;
        }
    }
    return nullptr;
}

bool Configuration::has(std::string_view path) const {
    const JsonValue* value = find(path);
    return value && !value->is_null();
}

bool Configuration::prefers_legacy(std::string_view path, std::string_view legacy_path) const {
    for (const auto& layer : layers_) {
        const JsonValue* current = walk(layer, path);
        if (current && !current->is_null()) return false;

        const JsonValue* legacy = walk(layer, legacy_path);
        if (legacy && !legacy->is_null()) return true;
    }
    return false;
}

JsonValue Configuration::merged() const {
    JsonValue result(JsonObject{});
    for (auto it = layers_.rbegin(); it != layers_.rend(); ++it) {
        merge_into(result, *it);
    }
    return result;
}

} // namespace httpconf
