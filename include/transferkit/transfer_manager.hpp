#pragma once

#include "resume_token.hpp"
#include "transfer_stream.hpp"
#include "transfer_task.hpp"
#include "transport.hpp"
#include "upload_body.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace transferkit {

// Runs at most one download and one upload at a time over an injected transport.
//
// Start calls never throw for transfer problems: bad URLs, a busy slot or an
// unusable resume token come back as the terminal event of the returned stream.
// Listeners run on the transfer's own thread; from there only the cancel calls
// are allowed, every other call throws std::logic_error.
class TransferManager {
public:
    TransferManager(TransportPtr transport, std::filesystem::path download_directory);
    ~TransferManager();

    TransferManager(const TransferManager&) = delete;
    TransferManager& operator=(const TransferManager&) = delete;

    // Resumes instead when a download of the same URL is paused; a paused download
    // of another URL is cancelled first.
    [[nodiscard]] TransferStream startDownload(const std::string& url);
    [[nodiscard]] TransferStream resumeDownload(const ResumeToken& token);
    // Blocks until the running download has stopped. Returns the token when bytes were
    // kept; otherwise the download ends as Cancelled. No-op without a running download.
    std::optional<ResumeToken> pauseDownload();
    void cancelDownload();

    [[nodiscard]] TransferStream startUpload(const std::string& url, std::string bytes, std::string content_type);
    [[nodiscard]] TransferStream startUpload(const std::string& url, UploadBody body);
    void cancelUpload();

    void cancel(TransferKind kind);

    // Non-terminal task of that kind, if any.
    [[nodiscard]] std::optional<TaskSnapshot> activeTask(TransferKind kind) const;
    [[nodiscard]] std::uint64_t sessionId() const noexcept;
    [[nodiscard]] const std::filesystem::path& downloadDirectory() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace transferkit
