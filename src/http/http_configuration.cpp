#include "httpconf/http/http_configuration.hpp"

#include <cctype>
#include <stdexcept>

#include "httpconf/config/reference.hpp"
#include "httpconf/crypto/codecs.hpp"
#include "httpconf/util/units.hpp"

namespace httpconf {

namespace {

constexpr std::string_view kFallbackSeed = "she sells sea shells on the sea shore";
constexpr std::string_view kSecondSeed = "the shells she sells are sea-shells";

bool is_blank(std::string_view s) {
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

// Collects the first failure while a section is read field by field
class SectionReader {
    const Configuration& config_;
    const Logger& logger_;
    std::optional<Error> error_;

public:
    SectionReader(const Configuration& config, const Logger& logger)
        : config_(config), logger_(logger) {}

    template<typename T>
    void read(std::string_view key, T& out) {
        if (error_) return;
        auto value = config_.get<T>(key);
        if (!value) {
            error_ = value.error();
            return;
        }
        out = std::move(*value);
    }

    template<typename T>
    void read(std::string_view key, std::string_view legacy_key, T& out) {
        if (error_) return;
        auto value = config_.get_deprecated<T>(key, legacy_key, logger_);
        if (!value) {
            error_ = value.error();
            return;
        }
        out = std::move(*value);
    }

    void read_bytes(std::string_view key, std::string_view legacy_key, int64_t& out) {
        MemorySize size;
        if (legacy_key.empty()) {
            read(key, size);
        } else {
            read(key, legacy_key, size);
        }
        if (!error_) out = size.to_bytes();
    }

    void read_same_site(std::string_view key, std::optional<SameSite>& out) {
        if (error_) return;
        auto value = parse_same_site(config_, key, logger_);
        if (!value) {
            error_ = value.error();
            return;
        }
        out = *value;
    }

    void read_jwt(std::string_view secret, std::string_view parent, JwtConfig& out) {
        if (error_) return;
        auto value = parse_jwt_config(config_, secret, parent);
        if (!value) {
            error_ = value.error();
            return;
        }
        out = std::move(*value);
    }

    const std::optional<Error>& error() const { return error_; }
};

expected<std::string, Error> get_path(const Configuration& config, std::string_view key,
                                      std::string_view legacy_key, const Logger& logger) {
    auto path = legacy_key.empty()
        ? config.get<std::string>(key)
        : config.get_deprecated<std::string>(key, legacy_key, logger);
    if (!path) return path;

    if (!path->starts_with('/')) {
        return unexpected(Error::invalid_path(std::string(key)));
    }
    return path;
}

Cookie make_cookie(std::string name, std::string value, const std::string& path,
                   const std::optional<std::string>& domain, bool secure, bool http_only,
                   std::optional<SameSite> same_site, bool partitioned) {
    Cookie c{std::move(name), std::move(value)};
    c.set_path(path)
     .set_secure(secure)
     .set_http_only(http_only)
     .set_same_site(same_site)
     .set_partitioned(partitioned);
    if (domain) {
        c.set_domain(*domain);
    }
    return c;
}

JsonValue optional_json(const std::optional<std::string>& value) {
    return value ? JsonValue(*value) : JsonValue(nullptr);
}

JsonValue same_site_json(const std::optional<SameSite>& value) {
    return value ? JsonValue(same_site_name(*value)) : JsonValue(nullptr);
}

JsonValue jwt_json(const JwtConfig& jwt) {
    return json_object()
        .set("signatureAlgorithm", jwt.signature_algorithm)
        .set("expiresAfter", jwt.expires_after
            ? JsonValue(units::format_duration(*jwt.expires_after)) : JsonValue(nullptr))
        .set("clockSkew", units::format_duration(jwt.clock_skew))
        .set("dataClaim", jwt.data_claim)
        .build();
}

} // anonymous namespace

// ============================================================================
// Cookie templates
// ============================================================================

Cookie SessionConfig::cookie(std::string value) const {
    Cookie c = make_cookie(cookie_name, std::move(value), path, domain, secure, http_only,
                           same_site, partitioned);
    if (max_age) {
        c.set_max_age(std::chrono::duration_cast<std::chrono::seconds>(*max_age));
    }
    return c;
}

Cookie SessionConfig::discarding_cookie() const {
    Cookie c = make_cookie(cookie_name, "", path, domain, secure, http_only, same_site, partitioned);
    Cookie expired = Cookie::expired(cookie_name);
    c.max_age = expired.max_age;
    c.expires = expired.expires;
    return c;
}

Cookie FlashConfig::cookie(std::string value) const {
    return make_cookie(cookie_name, std::move(value), path, domain, secure, http_only,
                       same_site, partitioned);
}

Cookie FlashConfig::discarding_cookie() const {
    Cookie c = make_cookie(cookie_name, "", path, domain, secure, http_only, same_site, partitioned);
    Cookie expired = Cookie::expired(cookie_name);
    c.max_age = expired.max_age;
    c.expires = expired.expires;
    return c;
}

// ============================================================================
// Snapshot rendering
// ============================================================================

JsonValue HttpConfiguration::to_json(bool show_secret) const {
    JsonValue session_json = json_object()
        .set("cookieName", session.cookie_name)
        .set("secure", session.secure)
        .set("maxAge", session.max_age
            ? JsonValue(units::format_duration(*session.max_age)) : JsonValue(nullptr))
        .set("httpOnly", session.http_only)
        .set("domain", optional_json(session.domain))
        .set("path", session.path)
        .set("sameSite", same_site_json(session.same_site))
        .set("partitioned", session.partitioned)
        .set("jwt", jwt_json(session.jwt))
        .build();

    JsonValue flash_json = json_object()
        .set("cookieName", flash.cookie_name)
        .set("secure", flash.secure)
        .set("httpOnly", flash.http_only)
        .set("domain", optional_json(flash.domain))
        .set("path", flash.path)
        .set("sameSite", same_site_json(flash.same_site))
        .set("partitioned", flash.partitioned)
        .set("jwt", jwt_json(flash.jwt))
        .build();

    JsonObject mime_types;
    for (const auto& [extension, type] : file_mime_types.mime_types) {
        mime_types[extension] = type;
    }

    return json_object()
        .set("context", context)
        .set("parser", json_object()
            .set("maxMemoryBuffer", static_cast<int64_t>(parser.max_memory_buffer))
            .set("maxDiskBuffer", static_cast<int64_t>(parser.max_disk_buffer))
            .set("allowEmptyFiles", parser.allow_empty_files)
            .build())
        .set("actionComposition", json_object()
            .set("controllerAnnotationsFirst", action_composition.controller_annotations_first)
            .set("executeActionCreatorActionFirst", action_composition.execute_action_creator_action_first)
            .set("includeWebSocketActions", action_composition.include_websocket_actions)
            .build())
        .set("cookies", json_object().set("strict", cookies.strict).build())
        .set("session", std::move(session_json))
        .set("flash", std::move(flash_json))
        .set("fileMimeTypes", JsonValue(std::move(mime_types)))
        .set("secret", json_object()
            .set("key", show_secret ? secret.secret : std::string(secret.secret.size(), '*'))
            .set("bits", static_cast<int64_t>(secret.secret.size() * 8))
            .set("provider", optional_json(secret.provider))
            .build())
        .build();
}

// ============================================================================
// Resolution
// ============================================================================

expected<std::optional<SameSite>, Error> parse_same_site(const Configuration& config,
                                                         std::string_view key,
                                                         const Logger& logger) {
    auto value = config.get<std::optional<std::string>>(key);
    if (!value) return unexpected(value.error());
    if (!*value) return std::optional<SameSite>{};

    auto result = parse_same_site_value(**value);
    if (!result) {
        logger.warn("Assuming " + std::string(key) + " = null, since \"" + **value +
                    "\" is not a valid SameSite value (" + std::string(same_site_values()) + ")");
    }
    return result;
}

expected<std::map<std::string, std::string>, Error> parse_file_mime_types(const Configuration& config) {
    auto text = config.get<std::string>("http.fileMimeTypes");
    if (!text) return unexpected(text.error());
    return parse_mime_types(*text);
}

std::string derive_dev_secret(const std::optional<std::string>& app_conf_location) {
    std::string seed = app_conf_location ? *app_conf_location : std::string(kFallbackSeed);

    // 64 bytes / 512 bits so that HS512 is satisfied
    return codecs::md5_hex(seed) + codecs::md5_hex(seed + std::string(kSecondSeed));
}

expected<SecretConfig, Error> resolve_secret(const Configuration& config,
                                             const Environment& environment,
                                             const Logger& logger) {
    auto raw = config.get<std::optional<std::string>>("http.secret.key");
    if (!raw) return unexpected(raw.error());

    bool unset = !*raw || **raw == kSentinelSecret || is_blank(**raw);

    SecretConfig result;
    if (unset && environment.is_prod()) {
        return unexpected(Error(ConfigError::MissingSecret, "http.secret",
            "The application secret has not been set, and we are in prod mode. "
            "Your application is not secure. To set the application secret, set "
            "http.secret.key or the APPLICATION_SECRET environment variable."));
    }

    if (unset) {
        auto location = environment.resource(kApplicationConfigResource);
        try {
            result.secret = derive_dev_secret(location);
        } catch (const std::runtime_error& e) {
            return unexpected(Error::bad_value("http.secret.key", e.what()));
        }

        auto entry = logger.entry(LogLevel::Debug, "Generated dev mode secret " + result.secret +
                                  " for app at " + location.value_or("unknown location"));
        entry.field("mode", mode_name(environment.mode()));
        logger.log(entry);
    } else {
        result.secret = **raw;
    }

    auto provider = config.get_deprecated<std::optional<std::string>>(
        "http.secret.provider", "crypto.provider", logger);
    if (!provider) return unexpected(provider.error());
    result.provider = *provider;

    return result;
}

expected<HttpConfiguration, Error> resolve(const Configuration& config,
                                           const Environment& environment,
                                           const Logger& logger) {
    HttpConfiguration http;

    auto context = get_path(config, "http.context", "application.context", logger);
    if (!context) return unexpected(context.error());
    auto session_path = get_path(config, "http.session.path", "", logger);
    if (!session_path) return unexpected(session_path.error());
    auto flash_path = get_path(config, "http.flash.path", "", logger);
    if (!flash_path) return unexpected(flash_path.error());

    if (config.has("mimetype")) {
        return unexpected(Error::forbidden_key("mimetype",
            "mimetype replaced by http.fileMimeTypes map"));
    }

    auto secret = resolve_secret(config, environment, logger);
    if (!secret) return unexpected(secret.error());

    http.context = std::move(*context);
    http.secret = std::move(*secret);
    const std::string& key = http.secret.secret;

    SectionReader reader(config, logger);

    reader.read_bytes("http.parser.maxMemoryBuffer", "parsers.text.maxLength", http.parser.max_memory_buffer);
    reader.read_bytes("http.parser.maxDiskBuffer", "", http.parser.max_disk_buffer);
    reader.read("http.parser.allowEmptyFiles", http.parser.allow_empty_files);

    reader.read("http.actionComposition.controllerAnnotationsFirst",
                http.action_composition.controller_annotations_first);
    reader.read("http.actionComposition.executeActionCreatorActionFirst",
                http.action_composition.execute_action_creator_action_first);
    reader.read("http.actionComposition.includeWebSocketActions",
                http.action_composition.include_websocket_actions);

    reader.read("http.cookies.strict", http.cookies.strict);

    auto& session = http.session;
    reader.read("http.session.cookieName", "session.cookieName", session.cookie_name);
    reader.read("http.session.secure", "session.secure", session.secure);
    reader.read("http.session.maxAge", "session.maxAge", session.max_age);
    reader.read("http.session.httpOnly", "session.httpOnly", session.http_only);
    reader.read("http.session.domain", "session.domain", session.domain);
    reader.read_same_site("http.session.sameSite", session.same_site);
    session.path = *session_path;
    reader.read("http.session.partitioned", "session.partitioned", session.partitioned);
    reader.read_jwt(key, "http.session.jwt", session.jwt);

    auto& flash = http.flash;
    reader.read("http.flash.cookieName", "flash.cookieName", flash.cookie_name);
    reader.read("http.flash.secure", flash.secure);
    reader.read("http.flash.httpOnly", flash.http_only);
    reader.read("http.flash.domain", flash.domain);
    reader.read_same_site("http.flash.sameSite", flash.same_site);
    flash.path = *flash_path;
    reader.read("http.flash.partitioned", flash.partitioned);
    reader.read_jwt(key, "http.flash.jwt", flash.jwt);

    if (reader.error()) {
        return unexpected(*reader.error());
    }

    auto mime_types = parse_file_mime_types(config);
    if (!mime_types) return unexpected(mime_types.error());
    http.file_mime_types.mime_types = std::move(*mime_types);

    auto entry = logger.entry(LogLevel::Debug, "Resolved HTTP configuration");
    entry.field("context", http.context)
         .field("session_cookie", http.session.cookie_name)
         .field("flash_cookie", http.flash.cookie_name)
         .field("mime_types", http.file_mime_types.mime_types.size());
    logger.log(entry);

    return http;
}

// ============================================================================
// Provider
// ============================================================================

HttpConfigurationProvider::HttpConfigurationProvider(Configuration config, Environment environment,
                                                     const Logger& logger)
    : config_(std::move(config))
    , environment_(std::move(environment))
    , logger_(logger)
{}

const expected<HttpConfiguration, Error>& HttpConfigurationProvider::get() const {
    std::call_once(once_, [this] {
        result_.emplace(resolve(config_, environment_, logger_));
    });
    return *result_;
}

const HttpConfiguration& HttpConfigurationProvider::throw_if_failed() const {
    const auto& result = get();
    if (!result) {
        throw ConfigException(result.error());
    }
    return *result;
}

} // namespace httpconf
