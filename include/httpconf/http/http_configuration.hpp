#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "httpconf/config/configuration.hpp"
#include "httpconf/config/environment.hpp"
#include "httpconf/core/error.hpp"
#include "httpconf/core/json.hpp"
#include "httpconf/core/logging.hpp"
#include "httpconf/http/cookie.hpp"
#include "httpconf/http/jwt.hpp"
#include "httpconf/http/mime_types.hpp"
#include "httpconf/util/expected.hpp"

namespace httpconf {

// Placeholder secret meaning "not configured"
inline constexpr std::string_view kSentinelSecret = "changeme";

// ============================================================================
// Configuration Sections
// ============================================================================

// The application secret. In prod mode it must be set to something other
// than the sentinel; in dev and test mode an unset secret is replaced by a
// stable value derived from the location of application.json.
struct SecretConfig {
    std::string secret = std::string(kSentinelSecret);

    // Crypto provider to use; platform default when unset
    std::optional<std::string> provider = std::nullopt;
};

struct CookiesConfig {
    // Discard the whole Cookie header when one cookie in it is invalid
    bool strict = true;
};

struct SessionConfig {
    std::string cookie_name = "APP_SESSION";
    bool secure = false;
    std::optional<std::chrono::milliseconds> max_age = std::nullopt;   // none = browser-session cookie
    bool http_only = true;
    std::optional<std::string> domain = std::nullopt;
    std::string path = "/";
    std::optional<SameSite> same_site = SameSite::Lax;
    bool partitioned = false;
    JwtConfig jwt;

    // Set-Cookie template carrying the configured attributes
    Cookie cookie(std::string value) const;
    Cookie discarding_cookie() const;
};

struct FlashConfig {
    std::string cookie_name = "APP_FLASH";
    bool secure = false;
    bool http_only = true;
    std::optional<std::string> domain = std::nullopt;
    std::string path = "/";
    std::optional<SameSite> same_site = SameSite::Lax;
    bool partitioned = false;
    JwtConfig jwt;

    Cookie cookie(std::string value) const;
    Cookie discarding_cookie() const;
};

struct ParserConfig {
    // Largest request body buffered in memory
    int64_t max_memory_buffer = 102400;

    // Largest request body buffered on disk
    int64_t max_disk_buffer = 10485760;

    // Accept empty file uploads (empty filename or empty file)
    bool allow_empty_files = false;
};

struct ActionCompositionConfig {
    bool controller_annotations_first = false;
    bool execute_action_creator_action_first = false;
    bool include_websocket_actions = false;
};

struct FileMimeTypesConfig {
    // Extension (no dot) to content type
    std::map<std::string, std::string> mime_types;
};

// ============================================================================
// HTTP Configuration
// ============================================================================

struct HttpConfiguration {
    std::string context = "/";
    ParserConfig parser;
    ActionCompositionConfig action_composition;
    CookiesConfig cookies;
    SessionConfig session;
    FlashConfig flash;
    FileMimeTypesConfig file_mime_types;
    SecretConfig secret;

    // Snapshot as JSON; the secret is masked unless `show_secret`
    JsonValue to_json(bool show_secret = false) const;
};

// ============================================================================
// Resolution
// ============================================================================

// Reads `key` as an optional SameSite; unrecognised values are logged and
// treated as absent.
expected<std::optional<SameSite>, Error> parse_same_site(const Configuration& config,
                                                         std::string_view key,
                                                         const Logger& logger);

// Reads "http.fileMimeTypes" and parses it with parse_mime_types().
expected<std::map<std::string, std::string>, Error> parse_file_mime_types(const Configuration& config);

// Resolves "http.secret.key" / "http.secret.provider" for the environment.
expected<SecretConfig, Error> resolve_secret(const Configuration& config,
                                             const Environment& environment,
                                             const Logger& logger);

// Secret used in dev and test mode when none is configured. Stable for a
// given application.json location; not a security measure.
std::string derive_dev_secret(const std::optional<std::string>& app_conf_location);

// Builds the full snapshot. All failures are fatal to application startup.
expected<HttpConfiguration, Error> resolve(const Configuration& config,
                                           const Environment& environment,
                                           const Logger& logger = null_logger());

// ============================================================================
// Provider (resolve once, share read-only)
// ============================================================================

class HttpConfigurationProvider {
    Configuration config_;
    Environment environment_;
    const Logger& logger_;

    mutable std::once_flag once_;
    mutable std::optional<expected<HttpConfiguration, Error>> result_;

public:
    HttpConfigurationProvider(Configuration config, Environment environment,
                              const Logger& logger = null_logger());

    HttpConfigurationProvider(const HttpConfigurationProvider&) = delete;
    HttpConfigurationProvider& operator=(const HttpConfigurationProvider&) = delete;

    // Resolves on first call; later calls return the cached outcome
    const expected<HttpConfiguration, Error>& get() const;

    // Throws ConfigException when resolution failed
    const HttpConfiguration& throw_if_failed() const;

    // Section accessors; throw ConfigException when resolution failed
    const ParserConfig& parser() const { return throw_if_failed().parser; }
    const CookiesConfig& cookies() const { return throw_if_failed().cookies; }
    const SessionConfig& session() const { return throw_if_failed().session; }
    const FlashConfig& flash() const { return throw_if_failed().flash; }
    const ActionCompositionConfig& action_composition() const { return throw_if_failed().action_composition; }
    const FileMimeTypesConfig& file_mime_types() const { return throw_if_failed().file_mime_types; }
    const SecretConfig& secret() const { return throw_if_failed().secret; }
};

} // namespace httpconf
