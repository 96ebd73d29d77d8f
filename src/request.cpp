#include "batchdl/request.hpp"

#include "batchdl/error.hpp"

#include <filesystem>
#include <memory>

#include <curl/curl.h>
#include <fmt/format.h>

namespace batchdl {

namespace {

using UrlHandle = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;

struct CurlString {
    char* value{nullptr};
    ~CurlString() { curl_free(value); }
};

UrlHandle parseUrl(const std::string& url) {
    UrlHandle handle{curl_url(), &curl_url_cleanup};
    if (!handle) {
        throw Error(ErrorKind::Internal, "Failed to allocate URL handle");
    }

    const CURLUcode rc = curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0);
    if (rc != CURLUE_OK) {
        throw Error(ErrorKind::InvalidRequest,
                    fmt::format("Invalid URL '{}': {}", url, curl_url_strerror(rc)));
    }
    return handle;
}

std::string getPart(const UrlHandle& handle, CURLUPart part, unsigned int flags = 0) {
    CurlString out;
    if (curl_url_get(handle.get(), part, &out.value, flags) != CURLUE_OK || !out.value) {
        return {};
    }
    return out.value;
}

} // namespace

std::string filenameFromUrl(const std::string& url) {
    const auto handle = parseUrl(url);
    const std::string path = getPart(handle, CURLUPART_PATH, CURLU_URLDECODE);

    const auto slash = path.find_last_of('/');
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    if (name.empty() || name == "." || name == "..") {
        name = "index.html";
    }
    return name;
}

Request makeRequest(const std::string& destination_dir, const std::string& url) {
    const auto handle = parseUrl(url);
    const std::string scheme = getPart(handle, CURLUPART_SCHEME);
    if (scheme != "file" && getPart(handle, CURLUPART_HOST).empty()) {
        throw Error(ErrorKind::InvalidRequest, fmt::format("URL has no host: {}", url));
    }

    Request request;
    request.url = url;
    request.filename = (std::filesystem::path{destination_dir} / filenameFromUrl(url)).string();
    return request;
}

} // namespace batchdl
