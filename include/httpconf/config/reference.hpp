#pragma once

#include <string_view>

#include "httpconf/config/configuration.hpp"

namespace httpconf {

// Primary application configuration resource, looked up through
// Environment::resource(). Its location also seeds the dev-mode secret.
inline constexpr std::string_view kApplicationConfigResource = "application.json";

// Built-in defaults for every key read by resolve(). Applications layer
// their own configuration on top with with_fallback().
const Configuration& reference_configuration();

// Default extension to content-type table, in http.fileMimeTypes format
std::string_view default_file_mime_types() noexcept;

} // namespace httpconf
