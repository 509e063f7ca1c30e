#include "transferkit/curl_transport.hpp"
#include "transferkit/detail/curl_utils.hpp"

#include <algorithm>
#include <atomic>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <curl/curl.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <unistd.h>

namespace transferkit {

namespace fs = std::filesystem;

namespace {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

struct FileDeleter {
    void operator()(FILE* fp) const noexcept {
        if (fp) {
            std::fclose(fp);
        }
    }
};

using FilePtr = std::unique_ptr<FILE, FileDeleter>;

struct ExchangeContext {
    const ProgressHandler* on_progress{nullptr};
    const StopSignal* stop{nullptr};
    bool upload{false};
    // Bytes already on disk before this exchange started.
    std::uint64_t offset{0};
    std::uint64_t last_transferred{0};
    std::uint64_t last_expected{0};
    Headers headers;
    char error_buffer[CURL_ERROR_SIZE]{};
};

struct DownloadContext : ExchangeContext {
    CURL* handle{nullptr};
    FILE* file{nullptr};
    std::uint64_t written{0};
    bool status_checked{false};
    // Error replies to a range request leave the retained bytes alone.
    bool skip_body{false};
    std::string write_error;
};

size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* ctx = static_cast<ExchangeContext*>(userdata);
    const size_t total = size * nitems;
    if (ctx) {
        parseHeaderLine(std::string_view(buffer, total), ctx->headers);
    }
    return total;
}

int progressCallback(void* userdata, curl_off_t dltotal, curl_off_t dlnow, curl_off_t ultotal, curl_off_t ulnow) {
    auto* ctx = static_cast<ExchangeContext*>(userdata);
    if (!ctx) {
        return 0;
    }
    if (ctx->stop && ctx->stop->requested()) {
        return 1;
    }

    const curl_off_t now = ctx->upload ? ulnow : dlnow;
    const curl_off_t total = ctx->upload ? ultotal : dltotal;
    const std::uint64_t transferred = ctx->offset + static_cast<std::uint64_t>(std::max<curl_off_t>(0, now));
    const std::uint64_t expected = total > 0 ? ctx->offset + static_cast<std::uint64_t>(total) : 0;

    // curl calls back on a timer as well; only byte movement is reported.
    if (transferred == ctx->last_transferred && expected == ctx->last_expected) {
        return 0;
    }
    ctx->last_transferred = transferred;
    ctx->last_expected = expected;
    if (ctx->on_progress && *ctx->on_progress) {
        (*ctx->on_progress)(transferred, expected);
    }
    return 0;
}

size_t appendToString(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    if (!out) {
        return 0;
    }
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

size_t writeToFile(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<DownloadContext*>(userdata);
    if (!ctx || !ctx->file) {
        return 0;
    }

    const size_t total = size * nmemb;
    if (ctx->stop && ctx->stop->requested()) {
        return 0;
    }

    if (!ctx->status_checked) {
        ctx->status_checked = true;
        long code = 0;
        curl_easy_getinfo(ctx->handle, CURLINFO_RESPONSE_CODE, &code);
        if (ctx->offset > 0 && code != 206 && code != 0 && !isSuccessStatus(code)) {
            spdlog::debug("CurlTransport: server answered {} to a range request, partial file kept", code);
            ctx->skip_body = true;
        } else if (ctx->offset > 0 && code != 206 && code != 0) {
            // Range refused or validator mismatch: the body starts over at byte 0.
            spdlog::debug("CurlTransport: server answered {} to a range request, restarting body", code);
            if (ftruncate(fileno(ctx->file), 0) == -1 || fseeko(ctx->file, 0, SEEK_SET) != 0) {
                ctx->write_error = "Cannot reset partial file";
                return 0;
            }
            ctx->offset = 0;
            ctx->written = 0;
        }
    }

    if (ctx->skip_body) {
        return total;
    }

    const size_t written = std::fwrite(ptr, 1, total, ctx->file);
    ctx->written += written;
    if (written != total) {
        ctx->write_error = "Failed to write output file";
    }
    return written;
}

std::string describe(CURLcode code, const ExchangeContext& ctx) {
    if (ctx.error_buffer[0] != '\0') {
        return ctx.error_buffer;
    }
    return curl_easy_strerror(code);
}

std::string entityValidator(const Headers& headers) {
    // If-Range only accepts strong entity tags.
    if (auto etag = findHeader(headers, "etag"); etag && etag->rfind("W/", 0) != 0) {
        return *etag;
    }
    return findHeader(headers, "last-modified").value_or(std::string{});
}

// Total length from "Content-Range: bytes */N", 0 when absent.
std::uint64_t unsatisfiedRangeTotal(const Headers& headers) {
    const auto range = findHeader(headers, "content-range");
    if (!range) {
        return 0;
    }
    const auto slash = range->rfind('/');
    if (slash == std::string::npos || slash + 1 >= range->size()) {
        return 0;
    }
    try {
        return std::stoull(range->substr(slash + 1));
    } catch (const std::exception&) {
        return 0;
    }
}

TransportOutcome failedOutcome(std::string error) {
    TransportOutcome outcome;
    outcome.status = TransportOutcome::Status::Failed;
    outcome.error = std::move(error);
    return outcome;
}

TransportOutcome interruptedOutcome() {
    TransportOutcome outcome;
    outcome.status = TransportOutcome::Status::Interrupted;
    return outcome;
}

void removeQuietly(const fs::path& path) noexcept {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        spdlog::warn("CurlTransport: cannot remove {}: {}", path.string(), ec.message());
    }
}

} // namespace

class CurlTransport::Impl {
public:
    explicit Impl(Options options) : options_(std::move(options)) {
        detail::ensureCurlInitialized();

        std::error_code ec;
        fs::create_directories(options_.spool_directory, ec);
        if (ec) {
            throw std::runtime_error(fmt::format("Failed to create spool directory {}: {}",
                                                 options_.spool_directory.string(), ec.message()));
        }
    }

    TransportOutcome get(const std::string& url) {
        CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
        if (!curl) {
            return failedOutcome("Failed to allocate curl handle");
        }

        ExchangeContext ctx;
        std::string body;
        configure(curl.get(), url, ctx);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &appendToString);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);

        const CURLcode res = curl_easy_perform(curl.get());
        if (res != CURLE_OK) {
            return failedOutcome(describe(res, ctx));
        }

        TransportOutcome outcome;
        outcome.status = TransportOutcome::Status::Completed;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &outcome.response.status_code);
        outcome.response.headers = std::move(ctx.headers);
        outcome.response.body = std::move(body);
        spdlog::debug("CurlTransport: GET {} -> {} ({} bytes)", url, outcome.response.status_code,
                      outcome.response.body.size());
        return outcome;
    }

    TransportOutcome download(const std::string& url,
                              const std::optional<Continuation>& resume,
                              const ProgressHandler& on_progress,
                              const StopSignal& stop) {
        fs::path path;
        std::uint64_t offset = 0;
        std::string validator;
        if (resume) {
            path = resume->partial_file;
            offset = retainedBytes(*resume);
            if (offset > 0) {
                validator = resume->validator;
            }
        } else {
            path = nextSpoolPath();
        }

        FilePtr file{std::fopen(path.c_str(), offset > 0 ? "ab" : "wb")};
        if (!file) {
            return failedOutcome(fmt::format("Cannot open spool file {}", path.string()));
        }

        CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
        if (!curl) {
            file.reset();
            removeQuietly(path);
            return failedOutcome("Failed to allocate curl handle");
        }

        DownloadContext ctx;
        ctx.on_progress = &on_progress;
        ctx.stop = &stop;
        ctx.offset = offset;
        ctx.handle = curl.get();
        ctx.file = file.get();
        configure(curl.get(), url, ctx);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &writeToFile);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);

        HeaderList headers{nullptr, &curl_slist_free_all};
        std::string range;
        if (offset > 0) {
            range = std::to_string(offset) + "-";
            curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());
            if (!validator.empty()) {
                headers.reset(curl_slist_append(nullptr, ("If-Range: " + validator).c_str()));
                curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
            }
            spdlog::debug("CurlTransport: resuming {} from byte {}", url, offset);
        }

        const CURLcode res = curl_easy_perform(curl.get());

        long code = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
        // Releases the connection before the outcome is acted upon.
        curl.reset();

        const bool flushed = std::fflush(file.get()) == 0;
        file.reset();

        // 416 against a partial file that already holds the whole entity.
        if (res == CURLE_OK && code == 416 && offset > 0 &&
            (offset == resume->total_bytes || offset == unsatisfiedRangeTotal(ctx.headers))) {
            spdlog::debug("CurlTransport: {} already complete at {} bytes", url, offset);
            code = 206;
        }

        if (res == CURLE_OK && ctx.write_error.empty() && flushed) {
            // The last progress callback can precede the final write.
            const std::uint64_t total = ctx.offset + ctx.written;
            if (on_progress && total != ctx.last_transferred) {
                on_progress(total, std::max(total, ctx.last_expected));
            }

            TransportOutcome outcome;
            outcome.status = TransportOutcome::Status::Completed;
            outcome.response.status_code = code;
            outcome.response.headers = std::move(ctx.headers);
            outcome.file = path;
            spdlog::debug("CurlTransport: GET {} -> {} ({} bytes spooled)", url, code, ctx.offset + ctx.written);
            return outcome;
        }

        if (stop.reason() == StopReason::Pause) {
            const std::uint64_t kept = ctx.offset + ctx.written;
            const bool usable = code == 0 || isSuccessStatus(code);
            if (kept > 0 && usable && flushed) {
                auto outcome = interruptedOutcome();
                Continuation continuation;
                continuation.url = url;
                continuation.partial_file = path;
                continuation.bytes_received = kept;
                continuation.total_bytes = ctx.last_expected;
                continuation.validator = entityValidator(ctx.headers);
                if (continuation.validator.empty() && ctx.offset > 0) {
                    continuation.validator = validator;
                }
                outcome.continuation = std::move(continuation);
                spdlog::debug("CurlTransport: {} paused with {} bytes kept", url, kept);
                return outcome;
            }
            removeQuietly(path);
            return interruptedOutcome();
        }

        removeQuietly(path);
        if (stop.requested()) {
            return interruptedOutcome();
        }
        if (!ctx.write_error.empty()) {
            return failedOutcome(ctx.write_error);
        }
        if (!flushed) {
            return failedOutcome("Failed to flush output file");
        }
        return failedOutcome(describe(res, ctx));
    }

    TransportOutcome upload(const std::string& url,
                            const std::string& body,
                            const std::string& content_type,
                            const ProgressHandler& on_progress,
                            const StopSignal& stop) {
        CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
        if (!curl) {
            return failedOutcome("Failed to allocate curl handle");
        }

        ExchangeContext ctx;
        ctx.on_progress = &on_progress;
        ctx.stop = &stop;
        ctx.upload = true;
        std::string response_body;
        configure(curl.get(), url, ctx);
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.data());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &appendToString);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_body);

        const std::string type = content_type.empty() ? "application/octet-stream" : content_type;
        HeaderList headers{curl_slist_append(nullptr, ("Content-Type: " + type).c_str()), &curl_slist_free_all};
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());

        const CURLcode res = curl_easy_perform(curl.get());
        if (res == CURLE_OK) {
            TransportOutcome outcome;
            outcome.status = TransportOutcome::Status::Completed;
            curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &outcome.response.status_code);
            outcome.response.headers = std::move(ctx.headers);
            outcome.response.body = std::move(response_body);
            spdlog::debug("CurlTransport: POST {} ({} bytes) -> {}", url, body.size(), outcome.response.status_code);
            return outcome;
        }
        if (stop.requested()) {
            return interruptedOutcome();
        }
        return failedOutcome(describe(res, ctx));
    }

    void discard(const Continuation& continuation) noexcept {
        removeQuietly(continuation.partial_file);
    }

private:
    void configure(CURL* curl, const std::string& url, ExchangeContext& ctx) const {
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.user_agent.c_str());
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, options_.connect_timeout_ms);
        if (options_.low_speed_limit > 0 && options_.low_speed_time > 0) {
            curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, options_.low_speed_limit);
            curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, options_.low_speed_time);
        }
        curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, ctx.error_buffer);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, &headerCallback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &ctx);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, &progressCallback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &ctx);
    }

    fs::path nextSpoolPath() {
        return options_.spool_directory /
               fmt::format("transferkit-{}-{}.part", static_cast<long>(getpid()), spool_counter_++);
    }

    // Bytes of `resume` still usable on disk; the file is trimmed to that length.
    static std::uint64_t retainedBytes(const Continuation& resume) {
        std::error_code ec;
        const auto size = fs::file_size(resume.partial_file, ec);
        if (ec) {
            return 0;
        }
        const std::uint64_t kept = std::min<std::uint64_t>(size, resume.bytes_received);
        if (kept != size) {
            fs::resize_file(resume.partial_file, kept, ec);
            if (ec) {
                return 0;
            }
        }
        return kept;
    }

    Options options_;
    std::atomic<std::uint64_t> spool_counter_{0};
};

CurlTransport::CurlTransport() : CurlTransport(Options{}) {}

CurlTransport::CurlTransport(Options options) : impl_(std::make_unique<Impl>(std::move(options))) {}

CurlTransport::~CurlTransport() = default;

TransportOutcome CurlTransport::get(const std::string& url) { return impl_->get(url); }

TransportOutcome CurlTransport::download(const std::string& url,
                                         const std::optional<Continuation>& resume,
                                         const ProgressHandler& on_progress,
                                         const StopSignal& stop) {
    return impl_->download(url, resume, on_progress, stop);
}

TransportOutcome CurlTransport::upload(const std::string& url,
                                       const std::string& body,
                                       const std::string& content_type,
                                       const ProgressHandler& on_progress,
                                       const StopSignal& stop) {
    return impl_->upload(url, body, content_type, on_progress, stop);
}

void CurlTransport::discard(const Continuation& continuation) noexcept { impl_->discard(continuation); }

} // namespace transferkit
