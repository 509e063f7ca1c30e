#include "transferkit/http.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace transferkit {

namespace {

std::string toLower(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

std::string_view trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

} // namespace

void parseHeaderLine(std::string_view line, Headers& headers) {
    line = trim(line);
    if (line.empty()) {
        return;
    }

    if (line.rfind("HTTP/", 0) == 0) {
        headers.clear();
        return;
    }

    const auto colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return;
    }

    auto name = toLower(trim(line.substr(0, colon)));
    headers[std::move(name)] = std::string(trim(line.substr(colon + 1)));
}

std::optional<std::string> findHeader(const Headers& headers, std::string_view name) {
    const auto it = headers.find(toLower(name));
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> dispositionFilename(std::string_view content_disposition) {
    const auto lowered = toLower(content_disposition);
    std::size_t pos = 0;
    while ((pos = lowered.find("filename", pos)) != std::string::npos) {
        std::size_t cursor = pos + 8;
        // filename*= carries an RFC 5987 encoded value; plain filename= is enough here.
        if (cursor < lowered.size() && lowered[cursor] == '*') {
            pos = cursor;
            continue;
        }
        while (cursor < lowered.size() && lowered[cursor] == ' ') {
            ++cursor;
        }
        if (cursor >= lowered.size() || lowered[cursor] != '=') {
            pos = cursor;
            continue;
        }
        ++cursor;
        while (cursor < lowered.size() && lowered[cursor] == ' ') {
            ++cursor;
        }

        std::string_view rest = content_disposition.substr(cursor);
        std::string value;
        if (!rest.empty() && rest.front() == '"') {
            const auto closing = rest.find('"', 1);
            value = std::string(rest.substr(1, closing == std::string_view::npos ? std::string_view::npos : closing - 1));
        } else {
            value = std::string(trim(rest.substr(0, rest.find(';'))));
        }

        if (value.empty()) {
            return std::nullopt;
        }
        return value;
    }
    return std::nullopt;
}

} // namespace transferkit
