#include "transferkit/transfer_task.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

namespace transferkit {

std::string_view toString(TransferKind kind) noexcept {
    return kind == TransferKind::Download ? "download" : "upload";
}

std::string_view toString(TransferState state) noexcept {
    switch (state) {
    case TransferState::Idle:
        return "idle";
    case TransferState::Running:
        return "running";
    case TransferState::Paused:
        return "paused";
    case TransferState::Completed:
        return "completed";
    case TransferState::Failed:
        return "failed";
    case TransferState::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

TransferTask::TransferTask(std::uint64_t id, TransferKind kind, std::string url)
    : id_(id), kind_(kind), url_(std::move(url)) {}

void TransferTask::start() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ == TransferState::Running) {
        throw TransferException(makeError(ErrorKind::AlreadyInProgress,
                                          fmt::format("{} #{} is already running", toString(kind_), id_)));
    }
    if (isTerminal(state_)) {
        throw std::logic_error(fmt::format("{} #{} cannot restart once {}", toString(kind_), id_, toString(state_)));
    }
    state_ = TransferState::Running;
    resume_token_.reset();
}

bool TransferTask::progressUpdate(double fraction) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ != TransferState::Running) {
        return false;
    }
    fraction = std::clamp(fraction, 0.0, 1.0);
    if (fraction < fraction_) {
        return false;
    }
    fraction_ = fraction;
    return true;
}

void TransferTask::recordBytes(std::uint64_t transferred, std::uint64_t expected) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ != TransferState::Running) {
        return;
    }
    transferred_bytes_ = std::max(transferred_bytes_, transferred);
    if (expected > 0) {
        expected_bytes_ = expected;
    }
}

bool TransferTask::complete() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ != TransferState::Running) {
        return false;
    }
    state_ = TransferState::Completed;
    fraction_ = 1.0;
    if (expected_bytes_ == 0) {
        expected_bytes_ = transferred_bytes_;
    }
    return true;
}

bool TransferTask::fail(Error error) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ != TransferState::Running) {
        return false;
    }
    state_ = TransferState::Failed;
    error_ = std::move(error);
    return true;
}

bool TransferTask::pause(std::optional<ResumeToken> token) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ != TransferState::Running) {
        return false;
    }
    if (token && kind_ == TransferKind::Download) {
        state_ = TransferState::Paused;
        resume_token_ = std::move(token);
    } else {
        state_ = TransferState::Cancelled;
        error_ = makeError(ErrorKind::Cancelled, "nothing retained to resume from");
    }
    return true;
}

bool TransferTask::cancel() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (isTerminal(state_)) {
        return false;
    }
    state_ = TransferState::Cancelled;
    error_ = makeError(ErrorKind::Cancelled);
    if (resume_token_) {
        resume_token_->invalidate();
        resume_token_.reset();
    }
    return true;
}

TransferState TransferTask::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

double TransferTask::progress() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return fraction_;
}

std::optional<ResumeToken> TransferTask::resumeToken() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return resume_token_;
}

std::optional<Error> TransferTask::error() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return error_;
}

TaskSnapshot TransferTask::snapshot() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    TaskSnapshot snapshot;
    snapshot.id = id_;
    snapshot.kind = kind_;
    snapshot.state = state_;
    snapshot.url = url_;
    snapshot.fraction = fraction_;
    snapshot.transferred_bytes = transferred_bytes_;
    snapshot.expected_bytes = expected_bytes_;
    snapshot.error = error_;
    return snapshot;
}

} // namespace transferkit
