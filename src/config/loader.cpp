#include "httpconf/config/loader.hpp"

#include <cstdlib>

#include "httpconf/config/reference.hpp"
#include "httpconf/core/json.hpp"

namespace httpconf {

namespace {

JsonValue override_value(const std::string& text) {
    auto parsed = json::parse(text, "<override>");
    if (parsed) {
        return std::move(*parsed);
    }
    return JsonValue(text);
}

} // anonymous namespace

std::optional<std::pair<std::string, std::string>> parse_override(std::string_view text) {
    size_t eq = text.find('=');
    if (eq == std::string_view::npos || eq == 0) {
        return std::nullopt;
    }
    return std::make_pair(std::string(text.substr(0, eq)), std::string(text.substr(eq + 1)));
}

expected<Configuration, Error> load_configuration(const Environment& environment,
                                                  const LoadOptions& options,
                                                  const Logger& logger) {
    Configuration config = reference_configuration();

    std::optional<std::filesystem::path> file = options.config_file;
    if (!file) {
        file = environment.resource_path(kApplicationConfigResource);
    }

    if (file) {
        auto loaded = Configuration::load_file(*file);
        if (!loaded) {
            return unexpected(loaded.error());
        }
        logger.debug("Loaded configuration from " + file->string());
        config = loaded->with_fallback(config);
    } else {
        logger.debug("No " + std::string(kApplicationConfigResource) + " found under " +
                     environment.root_path().string() + ", using defaults");
    }

    if (options.read_environment_variables) {
        std::string name(kSecretEnvironmentVariable);
        if (const char* secret = std::getenv(name.c_str())) {
            logger.debug("Using http.secret.key from " + name);
            config = Configuration::from_pairs({{"http.secret.key", std::string(secret)}})
                .with_fallback(config);
        }
    }

    if (!options.overrides.empty()) {
        std::vector<std::pair<std::string, JsonValue>> pairs;
        pairs.reserve(options.overrides.size());
        for (const auto& [key, value] : options.overrides) {
            pairs.emplace_back(key, override_value(value));
        }
        config = Configuration::from_pairs(std::move(pairs)).with_fallback(config);
    }

    return config;
}

} // namespace httpconf
