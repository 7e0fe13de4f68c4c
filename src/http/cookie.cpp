#include "httpconf/http/cookie.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace httpconf {

namespace {

std::string format_http_date(std::chrono::system_clock::time_point tp) {
    auto time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_val{};
    gmtime_r(&time_t_val, &tm_val);

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%a, %d %b %Y %H:%M:%S GMT");
    return oss.str();
}

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
        std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
            return std::tolower(static_cast<unsigned char>(x)) ==
                   std::tolower(static_cast<unsigned char>(y));
        });
}

} // anonymous namespace

// ============================================================================
// SameSite
// ============================================================================

std::string_view same_site_name(SameSite s) noexcept {
    switch (s) {
        case SameSite::None:   return "None";
        case SameSite::Lax:    return "Lax";
        case SameSite::Strict: return "Strict";
    }
    return "Lax";
}

std::optional<SameSite> parse_same_site_value(std::string_view value) {
    if (iequals(value, "strict")) return SameSite::Strict;
    if (iequals(value, "lax")) return SameSite::Lax;
    if (iequals(value, "none")) return SameSite::None;
    return std::nullopt;
}

std::string_view same_site_values() noexcept {
    return "strict, lax, none";
}

// ============================================================================
// Cookie Implementation
// ============================================================================

std::string Cookie::to_header() const {
    std::ostringstream oss;

    oss << name << "=" << value;

    if (domain) {
        oss << "; Domain=" << *domain;
    }

    if (path) {
        oss << "; Path=" << *path;
    }

    if (max_age) {
        oss << "; Max-Age=" << max_age->count();
    }

    if (expires) {
        oss << "; Expires=" << format_http_date(*expires);
    }

    if (secure) {
        oss << "; Secure";
    }

    if (http_only) {
        oss << "; HttpOnly";
    }

    if (same_site) {
        oss << "; SameSite=" << same_site_name(*same_site);
    }

    if (partitioned) {
        oss << "; Partitioned";
    }

    return oss.str();
}

Cookie Cookie::expired(std::string name) {
    Cookie c;
    c.name = std::move(name);
    c.value = "";
    c.max_age = std::chrono::seconds(0);
    c.expires = std::chrono::system_clock::time_point{};  // Unix epoch
    return c;
}

} // namespace httpconf
