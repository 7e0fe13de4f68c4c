#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace httpconf {

// Parse a newline-delimited "extension=mime/type" table. Lines are trimmed;
// blank lines, '#' comments and lines without '=' (or with nothing before
// it) are skipped. Later entries replace earlier ones.
std::map<std::string, std::string> parse_mime_types(std::string_view text);

// ============================================================================
// File MIME type lookup
// ============================================================================

class FileMimeTypes {
    std::map<std::string, std::string> types_;

public:
    FileMimeTypes() = default;
    explicit FileMimeTypes(std::map<std::string, std::string> types) : types_(std::move(types)) {}

    // Extension without the dot; case-insensitive
    std::optional<std::string_view> for_extension(std::string_view extension) const;

    // Looks at the text after the last '.' of the final path segment
    std::optional<std::string_view> for_file_name(std::string_view name) const;

    const std::map<std::string, std::string>& types() const noexcept { return types_; }
    size_t size() const noexcept { return types_.size(); }
};

} // namespace httpconf
