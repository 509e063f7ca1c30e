#include "transferkit/destination_resolver.hpp"
#include "transferkit/error.hpp"
#include "transferkit/url.hpp"

#include <atomic>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <unistd.h>

namespace transferkit {

namespace fs = std::filesystem;

namespace {

constexpr char kFallbackName[] = "download";

std::string sanitize(std::string_view name) {
    // Only the last component survives, whichever separator the server used.
    const auto slash = name.find_last_of("/\\");
    if (slash != std::string_view::npos) {
        name.remove_prefix(slash + 1);
    }

    std::string cleaned;
    cleaned.reserve(name.size());
    for (const char c : name) {
        if (static_cast<unsigned char>(c) >= 0x20 && c != 0x7f) {
            cleaned.push_back(c);
        }
    }

    if (cleaned.empty() || cleaned == "." || cleaned == "..") {
        return kFallbackName;
    }
    return cleaned;
}

[[noreturn]] void throwFileSystemFailure(const std::string& what, const std::error_code& ec) {
    throw TransferException(makeError(ErrorKind::FileSystemFailure, fmt::format("{}: {}", what, ec.message())));
}

fs::path stagingPathFor(const fs::path& destination) {
    static std::atomic<unsigned> counter{0};
    return destination.parent_path() /
           fmt::format(".{}.{}-{}.incoming", destination.filename().string(), static_cast<long>(getpid()),
                       counter++);
}

} // namespace

DestinationResolver::DestinationResolver(fs::path directory) : directory_(std::move(directory)) {}

fs::path DestinationResolver::destinationFor(std::string_view suggested_name) const {
    return directory_ / sanitize(suggested_name);
}

fs::path DestinationResolver::place(const fs::path& temporary, std::string_view suggested_name) const {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        throwFileSystemFailure(fmt::format("cannot create {}", directory_.string()), ec);
    }

    const auto destination = destinationFor(suggested_name);
    if (fs::is_directory(destination, ec)) {
        throw TransferException(makeError(ErrorKind::FileSystemFailure,
                                          fmt::format("{} is a directory", destination.string())));
    }

    // rename(2) replaces the target atomically when both sides share a filesystem.
    fs::rename(temporary, destination, ec);
    if (!ec) {
        spdlog::debug("DestinationResolver: moved {} to {}", temporary.string(), destination.string());
        return destination;
    }
    if (ec != std::errc::cross_device_link) {
        throwFileSystemFailure(fmt::format("cannot move {} to {}", temporary.string(), destination.string()), ec);
    }

    // Different filesystem: stage a full copy beside the target, then rename it into place.
    const auto staging = stagingPathFor(destination);
    fs::copy_file(temporary, staging, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        std::error_code cleanup;
        fs::remove(staging, cleanup);
        throwFileSystemFailure(fmt::format("cannot copy {} to {}", temporary.string(), staging.string()), ec);
    }
    fs::rename(staging, destination, ec);
    if (ec) {
        std::error_code cleanup;
        fs::remove(staging, cleanup);
        throwFileSystemFailure(fmt::format("cannot move {} to {}", staging.string(), destination.string()), ec);
    }

    fs::remove(temporary, ec);
    if (ec) {
        spdlog::warn("DestinationResolver: cannot remove {}: {}", temporary.string(), ec.message());
    }
    spdlog::debug("DestinationResolver: copied {} to {}", temporary.string(), destination.string());
    return destination;
}

std::string DestinationResolver::suggestedFilename(const Headers& headers, std::string_view url) {
    if (const auto disposition = findHeader(headers, "content-disposition")) {
        if (auto name = dispositionFilename(*disposition)) {
            return sanitize(*name);
        }
    }
    return sanitize(lastPathSegment(url));
}

} // namespace transferkit
