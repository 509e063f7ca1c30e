#pragma once

#include "error.hpp"
#include "http.hpp"

#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <variant>
#include <vector>

namespace transferkit {

struct ProgressEvent {
    std::uint64_t task_id{0};
    double fraction{0.0};
    std::uint64_t transferred_bytes{0};
    // 0 while the size is unknown.
    std::uint64_t expected_bytes{0};
};

enum class TransferStatus {
    Success,
    Failure,
};

struct TransferResult {
    TransferStatus status{TransferStatus::Failure};
    // Downloads carry the final path, uploads the response metadata.
    std::variant<std::monostate, std::filesystem::path, ResponseMetadata> payload;
    std::optional<Error> error;

    [[nodiscard]] static TransferResult downloaded(std::filesystem::path path);
    [[nodiscard]] static TransferResult uploaded(ResponseMetadata metadata);
    [[nodiscard]] static TransferResult failed(Error error);

    [[nodiscard]] bool ok() const noexcept { return status == TransferStatus::Success; }
    [[nodiscard]] const std::filesystem::path* file() const noexcept {
        return std::get_if<std::filesystem::path>(&payload);
    }
    [[nodiscard]] const ResponseMetadata* response() const noexcept {
        return std::get_if<ResponseMetadata>(&payload);
    }
};

struct TerminalEvent {
    std::uint64_t task_id{0};
    TransferResult result;
};

using TransferEvent = std::variant<ProgressEvent, TerminalEvent>;
using TransferListener = std::function<void(const TransferEvent&)>;

namespace detail {

// Ordered, replayable log of one task's events. Exactly one terminal event, always last.
class EventChannel {
public:
    explicit EventChannel(std::uint64_t task_id);

    void publish(const ProgressEvent& event);
    // The first terminal result wins; returns false for later ones.
    bool finish(TransferResult result);

    void subscribe(TransferListener listener);
    // Blocks until event `index` exists; nullopt when the log ended before it.
    [[nodiscard]] std::optional<TransferEvent> waitFor(std::size_t index) const;
    [[nodiscard]] std::shared_future<TransferResult> result() const { return future_; }
    [[nodiscard]] bool finished() const;
    [[nodiscard]] std::uint64_t taskId() const noexcept { return task_id_; }

private:
    void dispatch(const std::vector<TransferListener>& listeners, const TransferEvent& event) const;

    const std::uint64_t task_id_;
    // Held across listener calls so every listener sees events in publication order.
    std::recursive_mutex dispatch_mutex_;
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::vector<TransferEvent> events_;
    std::vector<TransferListener> listeners_;
    bool finished_{false};
    std::promise<TransferResult> promise_;
    std::shared_future<TransferResult> future_;
};

} // namespace detail

// Consumer handle on a task's events: `progress* terminal`.
// Listeners and blocking reads may be mixed freely; each handle keeps its own read position.
class TransferStream {
public:
    explicit TransferStream(std::shared_ptr<detail::EventChannel> channel);

    [[nodiscard]] std::uint64_t taskId() const noexcept { return channel_->taskId(); }

    // Replays what was already published, then delivers live events on the transfer thread.
    void subscribe(TransferListener listener) const;

    // Next unread event; nullopt once the terminal event has been read.
    [[nodiscard]] std::optional<TransferEvent> next();

    [[nodiscard]] TransferResult wait() const { return channel_->result().get(); }
    [[nodiscard]] std::shared_future<TransferResult> result() const { return channel_->result(); }
    [[nodiscard]] bool finished() const { return channel_->finished(); }

private:
    std::shared_ptr<detail::EventChannel> channel_;
    std::size_t cursor_{0};
};

} // namespace transferkit
