#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "httpconf/config/configuration.hpp"
#include "httpconf/config/environment.hpp"
#include "httpconf/core/error.hpp"
#include "httpconf/core/logging.hpp"
#include "httpconf/util/expected.hpp"

namespace httpconf {

// Environment variable mapped onto http.secret.key
inline constexpr std::string_view kSecretEnvironmentVariable = "APPLICATION_SECRET";

struct LoadOptions {
    // "key=value" pairs, highest precedence. Values are read as JSON when
    // they parse as JSON and as plain strings otherwise.
    std::vector<std::pair<std::string, std::string>> overrides;

    // Loaded in place of the application.json found through the environment
    std::optional<std::filesystem::path> config_file;

    // Consult APPLICATION_SECRET
    bool read_environment_variables = true;
};

// Splits "key=value" at the first '='; nullopt when there is no '=' or the
// key is empty.
std::optional<std::pair<std::string, std::string>> parse_override(std::string_view text);

// Layers, highest precedence first: overrides, APPLICATION_SECRET, the
// application config file, reference defaults.
expected<Configuration, Error> load_configuration(const Environment& environment,
                                                  const LoadOptions& options = {},
                                                  const Logger& logger = null_logger());

} // namespace httpconf
