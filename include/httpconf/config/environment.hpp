#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace httpconf {

// ============================================================================
// Application Mode
// ============================================================================

enum class Mode {
    Dev,
    Test,
    Prod
};

std::string_view mode_name(Mode mode) noexcept;

// "dev" / "test" / "prod" (also "development", "production"), case-insensitive
std::optional<Mode> parse_mode(std::string_view name);

// ============================================================================
// Environment
// ============================================================================

class Environment {
    std::filesystem::path root_path_;
    Mode mode_ = Mode::Dev;
    std::vector<std::filesystem::path> resource_dirs_;

public:
    // Resources are looked up under <root>/conf, then <root>.
    Environment(std::filesystem::path root_path, Mode mode);

    // Environment rooted at the current working directory
    static Environment simple(Mode mode = Mode::Test);

    const std::filesystem::path& root_path() const noexcept { return root_path_; }
    Mode mode() const noexcept { return mode_; }

    bool is_prod() const noexcept { return mode_ == Mode::Prod; }

    // Replace the directories searched by resource()
    Environment& set_resource_dirs(std::vector<std::filesystem::path> dirs);
    const std::vector<std::filesystem::path>& resource_dirs() const noexcept { return resource_dirs_; }

    // Location of a named resource as a "file:" URI, if it exists
    std::optional<std::string> resource(std::string_view name) const;

    // Absolute filesystem path of a named resource, if it exists
    std::optional<std::filesystem::path> resource_path(std::string_view name) const;
};

} // namespace httpconf
