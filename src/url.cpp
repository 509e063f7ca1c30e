#include "transferkit/url.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

namespace transferkit {

namespace {

bool isSchemeChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
}

bool hasWhitespace(std::string_view text) {
    return std::any_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) || std::iscntrl(c); });
}

std::string_view stripQueryAndFragment(std::string_view text) {
    const auto end = text.find_first_of("?#");
    return end == std::string_view::npos ? text : text.substr(0, end);
}

} // namespace

std::optional<ParsedUrl> parseUrl(std::string_view url) {
    if (url.empty() || hasWhitespace(url)) {
        return std::nullopt;
    }

    const auto separator = url.find("://");
    if (separator == std::string_view::npos || separator == 0) {
        return std::nullopt;
    }

    const auto scheme = url.substr(0, separator);
    if (!std::isalpha(static_cast<unsigned char>(scheme.front())) ||
        !std::all_of(scheme.begin(), scheme.end(), isSchemeChar)) {
        return std::nullopt;
    }

    ParsedUrl parsed;
    parsed.scheme.reserve(scheme.size());
    std::transform(scheme.begin(), scheme.end(), std::back_inserter(parsed.scheme),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const auto rest = url.substr(separator + 3);
    const auto authority_end = rest.find_first_of("/?#");
    const auto authority = rest.substr(0, authority_end);

    // file:///path has an empty authority; every other scheme needs a host.
    if (authority.empty() && parsed.scheme != "file") {
        return std::nullopt;
    }

    const auto at = authority.rfind('@');
    auto host_port = at == std::string_view::npos ? authority : authority.substr(at + 1);
    if (!host_port.empty() && host_port.front() == '[') {
        const auto closing = host_port.find(']');
        if (closing == std::string_view::npos) {
            return std::nullopt;
        }
        parsed.host = std::string(host_port.substr(0, closing + 1));
    } else {
        parsed.host = std::string(host_port.substr(0, host_port.find(':')));
    }
    if (parsed.host.empty() && parsed.scheme != "file") {
        return std::nullopt;
    }

    if (authority_end != std::string_view::npos) {
        parsed.path = std::string(stripQueryAndFragment(rest.substr(authority_end)));
    }
    return parsed;
}

std::string lastPathSegment(std::string_view url) {
    const auto parsed = parseUrl(url);
    if (!parsed) {
        return {};
    }

    std::string_view path = parsed->path;
    while (!path.empty() && path.back() == '/') {
        path.remove_suffix(1);
    }
    const auto slash = path.rfind('/');
    return std::string(slash == std::string_view::npos ? path : path.substr(slash + 1));
}

} // namespace transferkit
