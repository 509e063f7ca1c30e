#pragma once

#include "error.hpp"
#include "transport.hpp"

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace transferkit {

// Decodes a JSON array into records through T's nlohmann::json from_json.
template <typename T>
[[nodiscard]] std::vector<T> decodeRecords(const std::string& bytes) {
    try {
        return nlohmann::json::parse(bytes).get<std::vector<T>>();
    } catch (const nlohmann::json::exception& e) {
        throw DecodeFailed(e.what());
    }
}

class Fetcher {
public:
    explicit Fetcher(TransportPtr transport);

    // Body of a 2xx response. Throws FetchFailed (BadUrl, TransportFailure, BadServerResponse).
    [[nodiscard]] std::string fetchRaw(const std::string& url) const;

    // Additionally throws DecodeFailed when the body does not match T.
    template <typename T>
    [[nodiscard]] std::vector<T> fetchTyped(const std::string& url) const {
        return decodeRecords<T>(fetchRaw(url));
    }

private:
    TransportPtr transport_;
};

} // namespace transferkit
