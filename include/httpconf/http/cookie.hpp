#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <chrono>

namespace httpconf {

// ============================================================================
// Cookie SameSite Policy
// ============================================================================

enum class SameSite {
    None,       // Cookie sent with all requests (requires Secure)
    Lax,        // Cookie sent with top-level navigations and GET from third-party
    Strict      // Cookie only sent with same-site requests
};

// "Strict", "Lax", "None"
std::string_view same_site_name(SameSite s) noexcept;

// Case-insensitive; nullopt for anything else
std::optional<SameSite> parse_same_site_value(std::string_view value);

// "strict, lax, none" - for diagnostics
std::string_view same_site_values() noexcept;

// ============================================================================
// Cookie (for setting)
// ============================================================================

struct Cookie {
    std::string name;
    std::string value;

    std::optional<std::string> domain = std::nullopt;
    std::optional<std::string> path = std::nullopt;
    std::optional<std::chrono::seconds> max_age = std::nullopt;
    std::optional<std::chrono::system_clock::time_point> expires = std::nullopt;
    bool secure = false;
    bool http_only = false;
    std::optional<SameSite> same_site = std::nullopt;
    bool partitioned = false;

    // Fluent setters
    Cookie& set_domain(std::string d) { domain = std::move(d); return *this; }
    Cookie& set_path(std::string p) { path = std::move(p); return *this; }
    Cookie& set_max_age(std::chrono::seconds age) { max_age = age; return *this; }
    Cookie& set_expires(std::chrono::system_clock::time_point exp) { expires = exp; return *this; }
    Cookie& set_secure(bool s = true) { secure = s; return *this; }
    Cookie& set_http_only(bool h = true) { http_only = h; return *this; }
    Cookie& set_same_site(std::optional<SameSite> ss) { same_site = ss; return *this; }
    Cookie& set_partitioned(bool p = true) { partitioned = p; return *this; }

    // Serialize to Set-Cookie header value
    std::string to_header() const;

    // A cookie that expires immediately (for deletion)
    static Cookie expired(std::string name);
};

} // namespace httpconf
