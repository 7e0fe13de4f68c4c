#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <stdexcept>
#include <optional>

namespace httpconf {

// ============================================================================
// Configuration Errors
// ============================================================================

enum class ConfigError {
    InvalidPath = 1,
    MissingSecret,
    WeakSecret,
    ForbiddenKey,
    InvalidAlgorithm,
    MissingKey,
    BadValue
};

std::string_view config_error_name(ConfigError e) noexcept;

} // namespace httpconf

// Enable std::error_code integration - MUST be before make_error_code declarations
template<>
struct std::is_error_code_enum<httpconf::ConfigError> : std::true_type {};

namespace httpconf {

const std::error_category& config_error_category() noexcept;
std::error_code make_error_code(ConfigError e) noexcept;

// ============================================================================
// Secret strength details (WeakSecret only)
// ============================================================================

struct WeakSecretInfo {
    std::string algorithm;
    int required_bits = 0;
    int actual_bits = 0;
};

// ============================================================================
// Error
// ============================================================================

class Error {
    ConfigError kind_ = ConfigError::BadValue;
    std::string key_;
    std::string message_;
    std::optional<WeakSecretInfo> weak_secret_;

public:
    Error() = default;

    Error(ConfigError kind, std::string key, std::string message = "")
        : kind_(kind), key_(std::move(key)), message_(std::move(message)) {}

    // Factory methods
    static Error invalid_path(std::string key) {
        std::string msg = key + " must start with a /";
        return Error(ConfigError::InvalidPath, std::move(key), std::move(msg));
    }

    static Error missing_key(std::string key) {
        return Error(ConfigError::MissingKey, std::move(key), "No configuration setting found");
    }

    static Error bad_value(std::string key, std::string message) {
        return Error(ConfigError::BadValue, std::move(key), std::move(message));
    }

    static Error forbidden_key(std::string key, std::string message) {
        return Error(ConfigError::ForbiddenKey, std::move(key), std::move(message));
    }

    static Error weak_secret(std::string key, WeakSecretInfo info, std::string message);

    // Accessors
    ConfigError kind() const noexcept { return kind_; }
    const std::string& key() const noexcept { return key_; }
    std::string_view message() const noexcept { return message_; }
    const std::optional<WeakSecretInfo>& weak_secret_info() const noexcept { return weak_secret_; }

    bool is(ConfigError kind) const noexcept { return kind_ == kind; }

    std::error_code code() const noexcept { return make_error_code(kind_); }

    // "ConfigError::<Kind> at <key> - <message>"
    std::string to_string() const;

    bool operator==(const Error& other) const noexcept {
        return kind_ == other.kind_ && key_ == other.key_;
    }
    bool operator!=(const Error& other) const noexcept {
        return !(*this == other);
    }
};

// Thrown by callers that abort startup with an exception instead of
// inspecting the returned error.
class ConfigException : public std::runtime_error {
    Error error_;

public:
    explicit ConfigException(Error error)
        : std::runtime_error(error.to_string()), error_(std::move(error)) {}

    const Error& error() const noexcept { return error_; }
};

} // namespace httpconf
