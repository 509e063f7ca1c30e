#include "transferkit/detail/curl_utils.hpp"

#include <cstdlib>
#include <mutex>
#include <stdexcept>

#include <curl/curl.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace transferkit::detail {

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        const CURLcode code = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (code != CURLE_OK) {
            spdlog::critical("CurlTransport: libcurl initialization failed: {}", curl_easy_strerror(code));
            throw std::runtime_error(fmt::format("Failed to initialize libcurl: {}", curl_easy_strerror(code)));
        }
        std::atexit([] { curl_global_cleanup(); });

        const curl_version_info_data* info = curl_version_info(CURLVERSION_NOW);
        spdlog::debug("CurlTransport: libcurl {} ready ({})", info->version,
                      info->ssl_version ? info->ssl_version : "no TLS");
    });
}

} // namespace transferkit::detail
