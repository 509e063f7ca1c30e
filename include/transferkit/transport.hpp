#pragma once

#include "http.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace transferkit {

enum class StopReason {
    None,
    Cancel,
    Pause,
};

// Polled by a transport between chunks. Cancel overrides an earlier pause request.
class StopSignal {
public:
    void request(StopReason reason) noexcept;

    [[nodiscard]] StopReason reason() const noexcept { return reason_.load(); }
    [[nodiscard]] bool requested() const noexcept { return reason() != StopReason::None; }

private:
    std::atomic<StopReason> reason_{StopReason::None};
};

// Everything needed to continue a stopped download without refetching its bytes.
struct Continuation {
    std::string url;
    std::filesystem::path partial_file;
    std::uint64_t bytes_received{0};
    std::uint64_t total_bytes{0};
    // ETag or Last-Modified of the entity the partial bytes belong to.
    std::string validator;
};

struct TransportOutcome {
    enum class Status {
        Completed,
        Interrupted,
        Failed,
    };

    Status status{Status::Failed};
    HttpOutcome response;
    // Downloads: spooled body of a completed exchange.
    std::filesystem::path file;
    // Interrupted downloads that retained bytes.
    std::optional<Continuation> continuation;
    std::string error;
};

// transferred/expected in bytes; expected is 0 while unknown.
using ProgressHandler = std::function<void(std::uint64_t transferred, std::uint64_t expected)>;

class Transport {
public:
    virtual ~Transport() = default;

    // One-shot GET, body kept in memory.
    [[nodiscard]] virtual TransportOutcome get(const std::string& url) = 0;

    // GET spooled to a file. With `resume`, continues from its byte offset.
    // A pause request yields Interrupted with a continuation when bytes were kept;
    // a cancel request discards partial data.
    [[nodiscard]] virtual TransportOutcome download(const std::string& url,
                                                    const std::optional<Continuation>& resume,
                                                    const ProgressHandler& on_progress,
                                                    const StopSignal& stop) = 0;

    // One-shot POST of `body`. Any stop request interrupts it without a continuation.
    [[nodiscard]] virtual TransportOutcome upload(const std::string& url,
                                                  const std::string& body,
                                                  const std::string& content_type,
                                                  const ProgressHandler& on_progress,
                                                  const StopSignal& stop) = 0;

    // Drops the partial data behind a continuation that will never be resumed.
    virtual void discard(const Continuation& continuation) noexcept = 0;
};

using TransportPtr = std::shared_ptr<Transport>;

} // namespace transferkit
