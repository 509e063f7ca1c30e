#include "transferkit/resume_token.hpp"

#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace transferkit {

using json = nlohmann::json;

namespace {

constexpr int kBlobVersion = 1;

} // namespace

ResumeToken::ResumeToken(std::uint64_t session_id, std::uint64_t task_id, std::string url, std::string data)
    : session_id_(session_id),
      task_id_(task_id),
      url_(std::move(url)),
      data_(std::move(data)),
      state_(std::make_shared<State>()) {}

ResumeToken ResumeToken::issue(std::uint64_t session_id, std::uint64_t task_id, const Continuation& continuation) {
    json blob = {
        {"version", kBlobVersion},
        {"url", continuation.url},
        {"partialFile", continuation.partial_file.string()},
        {"bytesReceived", continuation.bytes_received},
        {"totalBytes", continuation.total_bytes},
        {"validator", continuation.validator},
    };
    return ResumeToken(session_id, task_id, continuation.url, blob.dump());
}

bool ResumeToken::consume() const noexcept {
    return !state_->consumed.exchange(true);
}

void ResumeToken::invalidate() const noexcept {
    state_->consumed.store(true);
}

std::optional<Continuation> ResumeToken::continuation() const {
    try {
        const auto blob = json::parse(data_);
        if (blob.at("version").get<int>() != kBlobVersion) {
            return std::nullopt;
        }

        Continuation continuation;
        continuation.url = blob.at("url").get<std::string>();
        continuation.partial_file = blob.at("partialFile").get<std::string>();
        continuation.bytes_received = blob.at("bytesReceived").get<std::uint64_t>();
        continuation.total_bytes = blob.at("totalBytes").get<std::uint64_t>();
        continuation.validator = blob.at("validator").get<std::string>();
        return continuation;
    } catch (const json::exception& e) {
        spdlog::warn("ResumeToken: unreadable continuation: {}", e.what());
        return std::nullopt;
    }
}

} // namespace transferkit
