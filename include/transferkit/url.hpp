#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace transferkit {

struct ParsedUrl {
    std::string scheme;
    std::string host;
    std::string path;
};

// Syntactic check only; nothing is resolved or contacted.
[[nodiscard]] std::optional<ParsedUrl> parseUrl(std::string_view url);

// Last non-empty path segment without query or fragment, or an empty string.
[[nodiscard]] std::string lastPathSegment(std::string_view url);

} // namespace transferkit
