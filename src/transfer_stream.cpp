#include "transferkit/transfer_stream.hpp"

#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

namespace transferkit {

TransferResult TransferResult::downloaded(std::filesystem::path path) {
    TransferResult result;
    result.status = TransferStatus::Success;
    result.payload = std::move(path);
    return result;
}

TransferResult TransferResult::uploaded(ResponseMetadata metadata) {
    TransferResult result;
    result.status = TransferStatus::Success;
    result.payload = std::move(metadata);
    return result;
}

TransferResult TransferResult::failed(Error error) {
    TransferResult result;
    result.status = TransferStatus::Failure;
    result.error = std::move(error);
    return result;
}

namespace detail {

EventChannel::EventChannel(std::uint64_t task_id) : task_id_(task_id), future_(promise_.get_future().share()) {}

void EventChannel::publish(const ProgressEvent& event) {
    std::lock_guard<std::recursive_mutex> dispatch_lock(dispatch_mutex_);
    std::vector<TransferListener> listeners;
    TransferEvent entry{event};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (finished_) {
            return;
        }
        events_.push_back(entry);
        listeners = listeners_;
    }
    cv_.notify_all();
    dispatch(listeners, entry);
}

bool EventChannel::finish(TransferResult result) {
    std::lock_guard<std::recursive_mutex> dispatch_lock(dispatch_mutex_);
    std::vector<TransferListener> listeners;
    TransferEvent entry{TerminalEvent{task_id_, result}};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (finished_) {
            return false;
        }
        finished_ = true;
        events_.push_back(entry);
        listeners.swap(listeners_);
    }
    promise_.set_value(std::move(result));
    cv_.notify_all();
    dispatch(listeners, entry);
    return true;
}

void EventChannel::subscribe(TransferListener listener) {
    if (!listener) {
        return;
    }

    std::lock_guard<std::recursive_mutex> dispatch_lock(dispatch_mutex_);
    std::vector<TransferEvent> backlog;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        backlog = events_;
        if (!finished_) {
            listeners_.push_back(listener);
        }
    }
    for (const auto& event : backlog) {
        dispatch({listener}, event);
    }
}

std::optional<TransferEvent> EventChannel::waitFor(std::size_t index) const {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [&] { return index < events_.size() || finished_; });
    if (index < events_.size()) {
        return events_[index];
    }
    return std::nullopt;
}

bool EventChannel::finished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_;
}

void EventChannel::dispatch(const std::vector<TransferListener>& listeners, const TransferEvent& event) const {
    for (const auto& listener : listeners) {
        try {
            listener(event);
        } catch (const std::exception& e) {
            spdlog::error("EventChannel: listener for task #{} threw: {}", task_id_, e.what());
        }
    }
}

} // namespace detail

TransferStream::TransferStream(std::shared_ptr<detail::EventChannel> channel) : channel_(std::move(channel)) {}

void TransferStream::subscribe(TransferListener listener) const {
    channel_->subscribe(std::move(listener));
}

std::optional<TransferEvent> TransferStream::next() {
    auto event = channel_->waitFor(cursor_);
    if (event) {
        ++cursor_;
    }
    return event;
}

} // namespace transferkit
