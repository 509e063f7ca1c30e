#pragma once

#include "transport.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace transferkit {

// Single-use capability to continue a paused download. Copies share one
// consumed flag, so consuming any copy invalidates all of them.
class ResumeToken {
public:
    ResumeToken(std::uint64_t session_id, std::uint64_t task_id, std::string url, std::string data);

    // Wraps a continuation into a token bound to one manager session and task.
    [[nodiscard]] static ResumeToken issue(std::uint64_t session_id, std::uint64_t task_id,
                                           const Continuation& continuation);

    [[nodiscard]] std::uint64_t sessionId() const noexcept { return session_id_; }
    [[nodiscard]] std::uint64_t taskId() const noexcept { return task_id_; }
    [[nodiscard]] const std::string& url() const noexcept { return url_; }
    // Opaque continuation blob.
    [[nodiscard]] const std::string& data() const noexcept { return data_; }
    [[nodiscard]] bool consumed() const noexcept { return state_->consumed.load(); }

    // True for exactly one caller across every copy.
    [[nodiscard]] bool consume() const noexcept;
    void invalidate() const noexcept;
    // True when both were copied from the same issued token.
    [[nodiscard]] bool isSameAs(const ResumeToken& other) const noexcept { return state_ == other.state_; }

    // Decodes the blob; nullopt when it is not a continuation this library wrote.
    [[nodiscard]] std::optional<Continuation> continuation() const;

private:
    struct State {
        std::atomic<bool> consumed{false};
    };

    std::uint64_t session_id_;
    std::uint64_t task_id_;
    std::string url_;
    std::string data_;
    std::shared_ptr<State> state_;
};

} // namespace transferkit
