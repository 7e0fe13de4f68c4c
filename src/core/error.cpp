#include "httpconf/core/error.hpp"
#include <sstream>

namespace httpconf {

// ============================================================================
// ConfigError Category
// ============================================================================

namespace {

class ConfigErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "httpconf.config";
    }

    std::string message(int ev) const override {
        switch (static_cast<ConfigError>(ev)) {
            case ConfigError::InvalidPath: return "Invalid path";
            case ConfigError::MissingSecret: return "Application secret not set";
            case ConfigError::WeakSecret: return "Application secret too short";
            case ConfigError::ForbiddenKey: return "Forbidden configuration key";
            case ConfigError::InvalidAlgorithm: return "Unknown signature algorithm";
            case ConfigError::MissingKey: return "Missing configuration key";
            case ConfigError::BadValue: return "Bad configuration value";
            default: return "Unknown configuration error";
        }
    }
};

const ConfigErrorCategory config_category_instance{};

} // anonymous namespace

std::string_view config_error_name(ConfigError e) noexcept {
    switch (e) {
        case ConfigError::InvalidPath: return "InvalidPath";
        case ConfigError::MissingSecret: return "MissingSecret";
        case ConfigError::WeakSecret: return "WeakSecret";
        case ConfigError::ForbiddenKey: return "ForbiddenKey";
        case ConfigError::InvalidAlgorithm: return "InvalidAlgorithm";
        case ConfigError::MissingKey: return "MissingKey";
        case ConfigError::BadValue: return "BadValue";
        default: return "Unknown";
    }
}

const std::error_category& config_error_category() noexcept {
    return config_category_instance;
}

std::error_code make_error_code(ConfigError e) noexcept {
    return {static_cast<int>(e), config_error_category()};
}

// ============================================================================
// Error Implementation
// ============================================================================

Error Error::weak_secret(std::string key, WeakSecretInfo info, std::string message) {
    Error e(ConfigError::WeakSecret, std::move(key), std::move(message));
    e.weak_secret_ = std::move(info);
    return e;
}

std::string Error::to_string() const {
    std::ostringstream oss;

    oss << "ConfigError::" << config_error_name(kind_);
    if (!key_.empty()) {
        oss << " at " << key_;
    }
    if (!message_.empty()) {
        oss << " - " << message_;
    }

    return oss.str();
}

} // namespace httpconf
