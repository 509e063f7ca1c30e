#pragma once

#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace transferkit {

// Serialized request body, produced before the upload starts.
struct UploadBody {
    std::string bytes;
    std::string content_type{"application/octet-stream"};
};

[[nodiscard]] inline UploadBody binaryBody(std::string bytes, std::string content_type = "application/octet-stream") {
    return {std::move(bytes), std::move(content_type)};
}

// Serializes `value` through its nlohmann::json to_json.
template <typename T>
[[nodiscard]] UploadBody jsonBody(const T& value) {
    return {nlohmann::json(value).dump(), "application/json"};
}

} // namespace transferkit
