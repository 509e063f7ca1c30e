#include "transferkit/fetcher.hpp"
#include "transferkit/url.hpp"

#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace transferkit {

Fetcher::Fetcher(TransportPtr transport) : transport_(std::move(transport)) {
    if (!transport_) {
        throw std::invalid_argument("Fetcher requires a transport");
    }
}

std::string Fetcher::fetchRaw(const std::string& url) const {
    if (!parseUrl(url)) {
        throw FetchFailed(makeError(ErrorKind::BadUrl, fmt::format("malformed URL '{}'", url)));
    }

    auto outcome = transport_->get(url);
    if (outcome.status != TransportOutcome::Status::Completed) {
        spdlog::error("Fetcher: GET {} failed: {}", url, outcome.error);
        throw FetchFailed(makeError(ErrorKind::TransportFailure, std::move(outcome.error)));
    }

    const long status = outcome.response.status_code;
    if (!isSuccessStatus(status)) {
        spdlog::warn("Fetcher: GET {} answered {}", url, status);
        throw FetchFailed(badServerResponse(status));
    }

    spdlog::debug("Fetcher: GET {} returned {} bytes", url, outcome.response.body.size());
    return std::move(outcome.response.body);
}

} // namespace transferkit
