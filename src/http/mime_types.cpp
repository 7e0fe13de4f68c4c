#include "httpconf/http/mime_types.hpp"

#include <algorithm>
#include <cctype>

namespace httpconf {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

std::string to_lower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // anonymous namespace

std::map<std::string, std::string> parse_mime_types(std::string_view text) {
    std::map<std::string, std::string> types;

    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos) {
            end = text.size();
        }

        auto line = trim(text.substr(start, end - start));
        start = end + 1;

        if (line.empty() || line.front() == '#') {
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string_view::npos || eq == 0) {
            continue;
        }

        types[std::string(line.substr(0, eq))] = std::string(line.substr(eq + 1));
    }

    return types;
}

std::optional<std::string_view> FileMimeTypes::for_extension(std::string_view extension) const {
    auto it = types_.find(std::string(extension));
    if (it == types_.end()) {
        it = types_.find(to_lower(extension));
    }
    if (it == types_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string_view> FileMimeTypes::for_file_name(std::string_view name) const {
    auto slash = name.find_last_of("/\\");
    if (slash != std::string_view::npos) {
        name.remove_prefix(slash + 1);
    }

    auto dot = name.rfind('.');
    if (dot == std::string_view::npos || dot + 1 == name.size()) {
        return std::nullopt;
    }
    return for_extension(name.substr(dot + 1));
}

} // namespace httpconf
