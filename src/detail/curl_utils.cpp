#include "batchdl/detail/curl_utils.hpp"

#include "batchdl/error.hpp"

#include <cstdlib>
#include <mutex>

#include <curl/curl.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace batchdl::detail {

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            throw Error(ErrorKind::Internal,
                        fmt::format("Failed to initialize libcurl: {}", curl_easy_strerror(rc)));
        }
        std::atexit([] { curl_global_cleanup(); });

        const curl_version_info_data* info = curl_version_info(CURLVERSION_NOW);
        spdlog::debug("Using libcurl {}", info && info->version ? info->version : "unknown");
    });
}

} // namespace batchdl::detail
