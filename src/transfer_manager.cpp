#include "transferkit/transfer_manager.hpp"
#include "transferkit/destination_resolver.hpp"
#include "transferkit/url.hpp"

#include <atomic>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace transferkit {

namespace fs = std::filesystem;

namespace {

std::atomic<std::uint64_t> next_session_id{1};

// Manager whose worker is running on this thread, if any.
thread_local const void* current_worker_owner = nullptr;

void removeSpooled(const fs::path& path) {
    if (path.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        spdlog::warn("TransferManager: cannot remove {}: {}", path.string(), ec.message());
    }
}

Error cancelledError() {
    return makeError(ErrorKind::Cancelled);
}

} // namespace

class TransferManager::Impl {
public:
    Impl(TransportPtr transport, fs::path download_directory)
        : transport_(std::move(transport)),
          resolver_(std::move(download_directory)),
          session_id_(next_session_id++) {
        if (!transport_) {
            throw std::invalid_argument("TransferManager requires a transport");
        }
    }

    ~Impl() {
        cancel(TransferKind::Download);
        cancel(TransferKind::Upload);
        std::lock_guard<std::mutex> control(control_mutex_);
        reap(download_);
        reap(upload_);
    }

    TransferStream startDownload(const std::string& url) {
        rejectNested("startDownload");
        if (!parseUrl(url)) {
            return rejected(makeError(ErrorKind::BadUrl, fmt::format("malformed URL '{}'", url)));
        }

        std::shared_ptr<detail::EventChannel> replaced;
        auto stream = startDownloadLocked(url, replaced);
        // Listeners of the replaced download may call back into the manager.
        finishCancelled(replaced);
        return stream;
    }

    TransferStream resumeDownload(const ResumeToken& token) {
        rejectNested("resumeDownload");
        std::lock_guard<std::mutex> control(control_mutex_);
        reap(download_);
        return resumeLocked(token);
    }

    std::optional<ResumeToken> pauseDownload() {
        rejectNested("pauseDownload");
        std::lock_guard<std::mutex> control(control_mutex_);

        TransferTaskPtr task;
        std::thread worker;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (!download_.task || download_.task->state() != TransferState::Running) {
                return std::nullopt;
            }
            task = download_.task;
            download_.stop->request(StopReason::Pause);
            worker = std::move(download_.worker);
        }
        if (worker.joinable()) {
            worker.join();
        }
        return task->resumeToken();
    }

    TransferStream startUpload(const std::string& url, std::string bytes, std::string content_type) {
        rejectNested("startUpload");
        if (!parseUrl(url)) {
            return rejected(makeError(ErrorKind::BadUrl, fmt::format("malformed URL '{}'", url)));
        }

        std::lock_guard<std::mutex> control(control_mutex_);
        reap(upload_);

        std::lock_guard<std::mutex> lock(state_mutex_);
        if (upload_.task && !isTerminal(upload_.task->state())) {
            return rejected(makeError(ErrorKind::AlreadyInProgress,
                                      fmt::format("upload #{} is still running", upload_.task->id())));
        }

        auto task = std::make_shared<TransferTask>(next_task_id_++, TransferKind::Upload, url);
        auto channel = std::make_shared<detail::EventChannel>(task->id());
        auto stop = std::make_shared<StopSignal>();
        task->start();

        spdlog::info("TransferManager: upload #{} started: {} ({} bytes, {})", task->id(), url, bytes.size(),
                     content_type);
        upload_.task = task;
        upload_.channel = channel;
        upload_.stop = stop;
        upload_.worker = std::thread(
            [this, task, channel, stop, url, bytes = std::move(bytes), content_type = std::move(content_type)]() {
                current_worker_owner = this;
                runUpload(task, channel, stop, url, bytes, content_type);
            });
        return TransferStream(channel);
    }

    void cancel(TransferKind kind) {
        Slot& slot = slotFor(kind);
        std::shared_ptr<detail::EventChannel> paused;

        // From a listener the worker cannot be joined; it winds down on its own.
        if (current_worker_owner == this) {
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                if (slot.task && slot.task->state() == TransferState::Running) {
                    slot.stop->request(StopReason::Cancel);
                    return;
                }
            }
            paused = cancelPaused(slot);
        } else {
            std::lock_guard<std::mutex> control(control_mutex_);
            std::thread worker;
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                if (slot.task && slot.task->state() == TransferState::Running) {
                    slot.stop->request(StopReason::Cancel);
                    worker = std::move(slot.worker);
                }
            }
            if (worker.joinable()) {
                worker.join();
                return;
            }
            paused = cancelPaused(slot);
        }
        finishCancelled(paused);
    }

    std::optional<TaskSnapshot> activeTask(TransferKind kind) const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        const Slot& slot = kind == TransferKind::Download ? download_ : upload_;
        if (!slot.task || isTerminal(slot.task->state())) {
            return std::nullopt;
        }
        return slot.task->snapshot();
    }

    [[nodiscard]] std::uint64_t sessionId() const noexcept { return session_id_; }
    [[nodiscard]] const fs::path& downloadDirectory() const noexcept { return resolver_.directory(); }

private:
    struct Slot {
        TransferTaskPtr task;
        std::shared_ptr<detail::EventChannel> channel;
        std::shared_ptr<StopSignal> stop;
        std::thread worker;
    };

    Slot& slotFor(TransferKind kind) { return kind == TransferKind::Download ? download_ : upload_; }

    void rejectNested(const char* operation) const {
        if (current_worker_owner == this) {
            throw std::logic_error(fmt::format("TransferManager::{} called from a transfer listener", operation));
        }
    }

    // Joins a worker whose task is no longer running. control_mutex_ must be held.
    void reap(Slot& slot) {
        std::thread finished;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (slot.worker.joinable() && (!slot.task || slot.task->state() != TransferState::Running)) {
                finished = std::move(slot.worker);
            }
        }
        if (finished.joinable()) {
            finished.join();
        }
    }

    TransferStream rejected(Error error) {
        auto channel = std::make_shared<detail::EventChannel>(next_task_id_++);
        if (error.kind == ErrorKind::AlreadyInProgress) {
            spdlog::warn("TransferManager: {}", error.message());
        } else {
            spdlog::error("TransferManager: {}", error.message());
        }
        channel->finish(TransferResult::failed(std::move(error)));
        return TransferStream(channel);
    }

    TransferStream startDownloadLocked(const std::string& url, std::shared_ptr<detail::EventChannel>& replaced) {
        std::lock_guard<std::mutex> control(control_mutex_);
        reap(download_);

        std::optional<ResumeToken> held;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (download_.task && download_.task->state() == TransferState::Running) {
                return rejected(makeError(ErrorKind::AlreadyInProgress,
                                          fmt::format("download #{} is still running", download_.task->id())));
            }
            if (download_.task && download_.task->state() == TransferState::Paused) {
                held = download_.task->resumeToken();
            }
        }

        if (held && held->url() == url) {
            return resumeLocked(*held);
        }
        if (held) {
            spdlog::info("TransferManager: replacing paused download of {} with {}", held->url(), url);
            replaced = cancelPaused(download_);
        }

        auto task = std::make_shared<TransferTask>(next_task_id_++, TransferKind::Download, url);
        auto channel = std::make_shared<detail::EventChannel>(task->id());
        auto stop = std::make_shared<StopSignal>();
        task->start();

        std::lock_guard<std::mutex> lock(state_mutex_);
        download_.task = task;
        download_.channel = channel;
        download_.stop = stop;
        download_.worker = std::thread([this, task, channel, stop, url]() {
            current_worker_owner = this;
            runDownload(task, channel, stop, url, std::nullopt);
        });
        spdlog::info("TransferManager: download #{} started: {}", task->id(), url);
        return TransferStream(channel);
    }

    // control_mutex_ must be held and the download worker reaped.
    TransferStream resumeLocked(const ResumeToken& token) {
        auto invalid = [this](const std::string& why) {
            return rejected(makeError(ErrorKind::InvalidResumeToken, why));
        };

        if (token.sessionId() != session_id_) {
            return invalid("token was issued by another manager");
        }
        if (token.consumed()) {
            return invalid("token was already used or discarded");
        }

        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!download_.task || download_.task->id() != token.taskId() ||
            download_.task->state() != TransferState::Paused) {
            return invalid("no paused download matches the token");
        }
        // The continuation comes from the held token, never from the caller's copy.
        const auto held = download_.task->resumeToken();
        if (!held || !held->isSameAs(token)) {
            return invalid("token was not issued for the paused download");
        }
        const auto continuation = held->continuation();
        if (!continuation) {
            return invalid("token data is unreadable");
        }
        if (!held->consume()) {
            return invalid("token was already used or discarded");
        }

        auto task = download_.task;
        auto channel = download_.channel;
        auto stop = std::make_shared<StopSignal>();
        task->start();

        download_.stop = stop;
        download_.worker = std::thread([this, task, channel, stop, continuation]() {
            current_worker_owner = this;
            runDownload(task, channel, stop, continuation->url, continuation);
        });
        spdlog::info("TransferManager: download #{} resumed at byte {}", task->id(), continuation->bytes_received);
        return TransferStream(channel);
    }

    // Cancels a paused task and drops its partial file. The returned channel is
    // finished by the caller once control_mutex_ is released.
    std::shared_ptr<detail::EventChannel> cancelPaused(Slot& slot) {
        std::optional<ResumeToken> token;
        std::shared_ptr<detail::EventChannel> channel;
        std::uint64_t id = 0;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (!slot.task || slot.task->state() != TransferState::Paused) {
                return nullptr;
            }
            token = slot.task->resumeToken();
            slot.task->cancel();
            channel = slot.channel;
            id = slot.task->id();
        }

        if (token) {
            if (const auto continuation = token->continuation()) {
                transport_->discard(*continuation);
            }
        }
        spdlog::info("TransferManager: paused download #{} cancelled", id);
        return channel;
    }

    static void finishCancelled(const std::shared_ptr<detail::EventChannel>& channel) {
        if (channel) {
            channel->finish(TransferResult::failed(cancelledError()));
        }
    }

    static void reportProgress(TransferTask& task, detail::EventChannel& channel,
                               std::uint64_t transferred, std::uint64_t expected) {
        task.recordBytes(transferred, expected);
        if (expected > 0) {
            const double fraction = static_cast<double>(transferred) / static_cast<double>(expected);
            if (!task.progressUpdate(fraction)) {
                return;
            }
        } else if (task.state() != TransferState::Running) {
            return;
        }
        channel.publish(ProgressEvent{task.id(), task.progress(), transferred, expected});
    }

    static void failTask(TransferTask& task, detail::EventChannel& channel, Error error) {
        if (!task.fail(error)) {
            return;
        }
        spdlog::error("TransferManager: {} #{} failed: {}", toString(task.kind()), task.id(), error.message());
        channel.finish(TransferResult::failed(std::move(error)));
    }

    static void cancelTask(TransferTask& task, detail::EventChannel& channel) {
        if (!task.cancel()) {
            return;
        }
        spdlog::info("TransferManager: {} #{} cancelled", toString(task.kind()), task.id());
        channel.finish(TransferResult::failed(cancelledError()));
    }

    void runDownload(const TransferTaskPtr& task, const std::shared_ptr<detail::EventChannel>& channel,
                     const std::shared_ptr<StopSignal>& stop, const std::string& url,
                     const std::optional<Continuation>& resume) {
        const ProgressHandler on_progress = [&task, &channel](std::uint64_t transferred, std::uint64_t expected) {
            reportProgress(*task, *channel, transferred, expected);
        };

        try {
            auto outcome = transport_->download(url, resume, on_progress, *stop);
            finishDownload(*task, *channel, stop->reason(), url, std::move(outcome));
        } catch (const std::exception& e) {
            failTask(*task, *channel, makeError(ErrorKind::TransportFailure, e.what()));
        }

        if (task->state() == TransferState::Running) {
            failTask(*task, *channel, makeError(ErrorKind::TransportFailure, "transfer ended without an outcome"));
        }
    }

    void finishDownload(TransferTask& task, detail::EventChannel& channel, StopReason stop_reason,
                        const std::string& url, TransportOutcome outcome) {
        switch (outcome.status) {
        case TransportOutcome::Status::Completed: {
            const long code = outcome.response.status_code;
            // Status 0 comes from schemes without one, such as file://.
            if (code != 0 && !isSuccessStatus(code)) {
                removeSpooled(outcome.file);
                failTask(task, channel, badServerResponse(code));
                return;
            }
            try {
                const auto name = DestinationResolver::suggestedFilename(outcome.response.headers, url);
                const auto path = resolver_.place(outcome.file, name);
                if (task.complete()) {
                    spdlog::info("TransferManager: download #{} saved to {}", task.id(), path.string());
                    channel.finish(TransferResult::downloaded(path));
                }
            } catch (const TransferException& e) {
                removeSpooled(outcome.file);
                failTask(task, channel, e.error());
            }
            return;
        }
        case TransportOutcome::Status::Interrupted:
            if (outcome.continuation && stop_reason == StopReason::Pause) {
                const auto bytes = outcome.continuation->bytes_received;
                if (task.pause(ResumeToken::issue(session_id_, task.id(), *outcome.continuation))) {
                    spdlog::info("TransferManager: download #{} paused after {} bytes", task.id(), bytes);
                    return;
                }
            }
            if (outcome.continuation) {
                transport_->discard(*outcome.continuation);
            }
            if (stop_reason == StopReason::Pause && task.pause(std::nullopt)) {
                spdlog::info("TransferManager: download #{} paused with nothing retained, cancelled", task.id());
                channel.finish(TransferResult::failed(cancelledError()));
                return;
            }
            cancelTask(task, channel);
            return;
        case TransportOutcome::Status::Failed:
            failTask(task, channel, makeError(ErrorKind::TransportFailure, std::move(outcome.error)));
            return;
        }
    }

    void runUpload(const TransferTaskPtr& task, const std::shared_ptr<detail::EventChannel>& channel,
                   const std::shared_ptr<StopSignal>& stop, const std::string& url,
                   const std::string& bytes, const std::string& content_type) {
        const ProgressHandler on_progress = [&task, &channel](std::uint64_t transferred, std::uint64_t expected) {
            reportProgress(*task, *channel, transferred, expected);
        };

        try {
            auto outcome = transport_->upload(url, bytes, content_type, on_progress, *stop);
            switch (outcome.status) {
            case TransportOutcome::Status::Completed:
                if (task->complete()) {
                    spdlog::info("TransferManager: upload #{} answered {}", task->id(), outcome.response.status_code);
                    channel->finish(TransferResult::uploaded(outcome.response.metadata()));
                }
                break;
            case TransportOutcome::Status::Interrupted:
                cancelTask(*task, *channel);
                break;
            case TransportOutcome::Status::Failed:
                failTask(*task, *channel, makeError(ErrorKind::TransportFailure, std::move(outcome.error)));
                break;
            }
        } catch (const std::exception& e) {
            failTask(*task, *channel, makeError(ErrorKind::TransportFailure, e.what()));
        }

        if (task->state() == TransferState::Running) {
            failTask(*task, *channel, makeError(ErrorKind::TransportFailure, "transfer ended without an outcome"));
        }
    }

    TransportPtr transport_;
    DestinationResolver resolver_;
    const std::uint64_t session_id_;
    std::atomic<std::uint64_t> next_task_id_{1};

    // Serializes public operations; held while joining workers.
    std::mutex control_mutex_;
    // Guards the slots. Workers take it only when a listener cancels.
    mutable std::mutex state_mutex_;
    Slot download_;
    Slot upload_;
};

TransferManager::TransferManager(TransportPtr transport, fs::path download_directory)
    : impl_(std::make_unique<Impl>(std::move(transport), std::move(download_directory))) {}

TransferManager::~TransferManager() = default;

TransferStream TransferManager::startDownload(const std::string& url) { return impl_->startDownload(url); }

TransferStream TransferManager::resumeDownload(const ResumeToken& token) { return impl_->resumeDownload(token); }

std::optional<ResumeToken> TransferManager::pauseDownload() { return impl_->pauseDownload(); }

void TransferManager::cancelDownload() { impl_->cancel(TransferKind::Download); }

TransferStream TransferManager::startUpload(const std::string& url, std::string bytes, std::string content_type) {
    return impl_->startUpload(url, std::move(bytes), std::move(content_type));
}

TransferStream TransferManager::startUpload(const std::string& url, UploadBody body) {
    return impl_->startUpload(url, std::move(body.bytes), std::move(body.content_type));
}

void TransferManager::cancelUpload() { impl_->cancel(TransferKind::Upload); }

void TransferManager::cancel(TransferKind kind) { impl_->cancel(kind); }

std::optional<TaskSnapshot> TransferManager::activeTask(TransferKind kind) const { return impl_->activeTask(kind); }

std::uint64_t TransferManager::sessionId() const noexcept { return impl_->sessionId(); }

const fs::path& TransferManager::downloadDirectory() const noexcept { return impl_->downloadDirectory(); }

} // namespace transferkit
