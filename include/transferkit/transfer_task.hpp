#pragma once

#include "error.hpp"
#include "resume_token.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace transferkit {

enum class TransferKind {
    Download,
    Upload,
};

enum class TransferState {
    Idle,
    Running,
    Paused,
    Completed,
    Failed,
    Cancelled,
};

[[nodiscard]] std::string_view toString(TransferKind kind) noexcept;
[[nodiscard]] std::string_view toString(TransferState state) noexcept;

[[nodiscard]] constexpr bool isTerminal(TransferState state) noexcept {
    return state == TransferState::Completed || state == TransferState::Failed ||
           state == TransferState::Cancelled;
}

struct TaskSnapshot {
    std::uint64_t id{0};
    TransferKind kind{TransferKind::Download};
    TransferState state{TransferState::Idle};
    std::string url;
    double fraction{0.0};
    std::uint64_t transferred_bytes{0};
    std::uint64_t expected_bytes{0};
    std::optional<Error> error;
};

// Lifecycle of one transfer:
//   Idle -> Running -> {Completed, Failed, Cancelled, Paused}
//   Paused -> Running | Cancelled
// Transition methods return false when the current state does not allow them.
class TransferTask {
public:
    TransferTask(std::uint64_t id, TransferKind kind, std::string url);

    TransferTask(const TransferTask&) = delete;
    TransferTask& operator=(const TransferTask&) = delete;

    // Idle|Paused -> Running. Throws TransferException(AlreadyInProgress) when running,
    // std::logic_error when the task already ended. Resuming clears the held token.
    void start();

    // Applies a new fraction while running; regressions are dropped.
    // Returns true when the value was taken.
    bool progressUpdate(double fraction);
    void recordBytes(std::uint64_t transferred, std::uint64_t expected);

    bool complete();
    bool fail(Error error);
    // Running -> Paused with a token, or Running -> Cancelled without one.
    bool pause(std::optional<ResumeToken> token);
    // Any non-terminal state -> Cancelled; the held token is invalidated.
    bool cancel();

    [[nodiscard]] std::uint64_t id() const noexcept { return id_; }
    [[nodiscard]] TransferKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& url() const noexcept { return url_; }
    [[nodiscard]] TransferState state() const;
    [[nodiscard]] double progress() const;
    [[nodiscard]] std::optional<ResumeToken> resumeToken() const;
    [[nodiscard]] std::optional<Error> error() const;
    [[nodiscard]] TaskSnapshot snapshot() const;

private:
    const std::uint64_t id_;
    const TransferKind kind_;
    const std::string url_;

    mutable std::mutex state_mutex_;
    TransferState state_{TransferState::Idle};
    double fraction_{0.0};
    std::uint64_t transferred_bytes_{0};
    std::uint64_t expected_bytes_{0};
    std::optional<ResumeToken> resume_token_;
    std::optional<Error> error_;
};

using TransferTaskPtr = std::shared_ptr<TransferTask>;

} // namespace transferkit
