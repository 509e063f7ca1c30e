#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace transferkit {

// Header names are stored lower-cased.
using Headers = std::map<std::string, std::string>;

struct ResponseMetadata {
    long status_code{0};
    Headers headers;
};

struct HttpOutcome {
    long status_code{0};
    Headers headers;
    std::string body;

    [[nodiscard]] ResponseMetadata metadata() const { return {status_code, headers}; }
};

[[nodiscard]] constexpr bool isSuccessStatus(long status_code) noexcept {
    return status_code >= 200 && status_code < 300;
}

// Parses one raw header line ("Name: value\r\n") into `headers`.
// Status lines reset the collection so only the final response's headers survive redirects.
void parseHeaderLine(std::string_view line, Headers& headers);

[[nodiscard]] std::optional<std::string> findHeader(const Headers& headers, std::string_view name);

// filename= parameter of a Content-Disposition value, if any.
[[nodiscard]] std::optional<std::string> dispositionFilename(std::string_view content_disposition);

} // namespace transferkit
