#include "httpconf/config/environment.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

namespace httpconf {

std::string_view mode_name(Mode mode) noexcept {
    switch (mode) {
        case Mode::Dev:  return "dev";
        case Mode::Test: return "test";
        case Mode::Prod: return "prod";
        default: return "unknown";
    }
}

std::optional<Mode> parse_mode(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "dev" || lowered == "development") return Mode::Dev;
    if (lowered == "test") return Mode::Test;
    if (lowered == "prod" || lowered == "production") return Mode::Prod;
    return std::nullopt;
}

Environment::Environment(std::filesystem::path root_path, Mode mode)
    : root_path_(std::move(root_path))
    , mode_(mode)
{
    resource_dirs_ = {root_path_ / "conf", root_path_};
}

Environment Environment::simple(Mode mode) {
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    return Environment(ec ? std::filesystem::path(".") : cwd, mode);
}

Environment& Environment::set_resource_dirs(std::vector<std::filesystem::path> dirs) {
    resource_dirs_ = std::move(dirs);
    return *this;
}

std::optional<std::filesystem::path> Environment::resource_path(std::string_view name) const {
    for (const auto& dir : resource_dirs_) {
        std::error_code ec;
        auto candidate = dir / name;
        if (std::filesystem::is_regular_file(candidate, ec)) {
            auto absolute = std::filesystem::absolute(candidate, ec);
            if (ec) {
                return candidate.lexically_normal();
            }
            return absolute.lexically_normal();
        }
    }
    return std::nullopt;
}

std::optional<std::string> Environment::resource(std::string_view name) const {
    auto path = resource_path(name);
    if (!path) {
        return std::nullopt;
    }
    return "file:" + path->generic_string();
}

} // namespace httpconf
