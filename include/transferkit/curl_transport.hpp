#pragma once

#include "transport.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace transferkit {

class CurlTransport final : public Transport {
public:
    struct Options {
        // Where in-flight download bodies are spooled.
        std::filesystem::path spool_directory{std::filesystem::temp_directory_path()};
        std::string user_agent{"transferkit/1.0"};
        long connect_timeout_ms{30000};
        // Abort when slower than low_speed_limit bytes/s for low_speed_time seconds; 0 disables.
        long low_speed_limit{0};
        long low_speed_time{0};
    };

    CurlTransport();
    explicit CurlTransport(Options options);
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    [[nodiscard]] TransportOutcome get(const std::string& url) override;
    [[nodiscard]] TransportOutcome download(const std::string& url,
                                            const std::optional<Continuation>& resume,
                                            const ProgressHandler& on_progress,
                                            const StopSignal& stop) override;
    [[nodiscard]] TransportOutcome upload(const std::string& url,
                                          const std::string& body,
                                          const std::string& content_type,
                                          const ProgressHandler& on_progress,
                                          const StopSignal& stop) override;
    void discard(const Continuation& continuation) noexcept override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace transferkit
