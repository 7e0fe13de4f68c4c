#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "httpconf/core/error.hpp"
#include "httpconf/core/json.hpp"
#include "httpconf/core/logging.hpp"
#include "httpconf/util/expected.hpp"
#include "httpconf/util/units.hpp"

namespace httpconf {

// ============================================================================
// Value conversion trait - JSON value to type T
// ============================================================================

template<typename T, typename = void>
struct ConfigValue;

template<>
struct ConfigValue<std::string> {
    static expected<std::string, Error> convert(const JsonValue& v, const std::string& key);
};

template<>
struct ConfigValue<bool> {
    static expected<bool, Error> convert(const JsonValue& v, const std::string& key);
};

template<>
struct ConfigValue<int64_t> {
    static expected<int64_t, Error> convert(const JsonValue& v, const std::string& key);
};

template<>
struct ConfigValue<double> {
    static expected<double, Error> convert(const JsonValue& v, const std::string& key);
};

template<>
struct ConfigValue<MemorySize> {
    static expected<MemorySize, Error> convert(const JsonValue& v, const std::string& key);
};

expected<std::chrono::nanoseconds, Error> convert_duration(const JsonValue& v, const std::string& key);

template<typename Rep, typename Period>
struct ConfigValue<std::chrono::duration<Rep, Period>> {
    static expected<std::chrono::duration<Rep, Period>, Error> convert(const JsonValue& v, const std::string& key) {
        auto d = convert_duration(v, key);
        if (!d) return unexpected(d.error());
        return std::chrono::duration_cast<std::chrono::duration<Rep, Period>>(*d);
    }
};

template<typename T>
struct is_optional : std::false_type {};

template<typename T>
struct is_optional<std::optional<T>> : std::true_type {};

// ============================================================================
// Configuration
// ============================================================================

// Read-only view over one or more JSON trees. Keys are dotted paths
// ("http.session.cookieName"). Layers are searched in order, so the first
// layer holding a path decides its value; an explicit null hides lower layers.
class Configuration {
    std::vector<JsonValue> layers_;

public:
    Configuration() = default;
    explicit Configuration(JsonValue root);

    static expected<Configuration, Error> parse(std::string_view text, std::string_view origin = "<json>");
    static expected<Configuration, Error> load_file(const std::filesystem::path& path);

    // Flat key/value pairs, e.g. {{"http.context", "/app"}}.
    static Configuration from_pairs(std::vector<std::pair<std::string, JsonValue>> pairs);

    // Layers of `fallback` are consulted after ours.
    Configuration with_fallback(const Configuration& fallback) const;

    // Present and not null
    bool has(std::string_view path) const;

    // Raw lookup; nullptr when absent. May return a null value.
    const JsonValue* find(std::string_view path) const;

    // Typed lookup. For std::optional<U>, absent and null map to nullopt;
    // for any other T they fail with MissingKey.
    template<typename T>
    expected<T, Error> get(std::string_view path) const {
        std::string key(path);
        const JsonValue* value = find(path);

        if constexpr (is_optional<T>::value) {
            using U = typename T::value_type;
            if (!value || value->is_null()) {
                return T{};
            }
            auto converted = ConfigValue<U>::convert(*value, key);
            if (!converted) return unexpected(converted.error());
            return T(std::move(*converted));
        } else {
            if (!value || value->is_null()) {
                return unexpected(Error::missing_key(std::move(key)));
            }
            return ConfigValue<T>::convert(*value, key);
        }
    }

    // Reads `path`, falling back to `legacy_path` when the legacy key is set
    // at a higher precedence than the new one. When both sit in the same
    // layer the new key wins. Use of the legacy key is logged as a warning.
    template<typename T>
    expected<T, Error> get_deprecated(std::string_view path, std::string_view legacy_path,
                                      const Logger& logger = null_logger()) const {
        if (prefers_legacy(path, legacy_path)) {
            logger.warn(std::string(legacy_path) + " is deprecated, use " + std::string(path) + " instead");
            return get<T>(legacy_path);
        }
        return get<T>(path);
    }

    // All layers merged into one tree, higher layers winning.
    JsonValue merged() const;

private:
    bool prefers_legacy(std::string_view path, std::string_view legacy_path) const;
};

} // namespace httpconf
