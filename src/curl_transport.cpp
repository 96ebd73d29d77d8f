#include "batchdl/curl_transport.hpp"

#include "batchdl/detail/curl_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <curl/curl.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace batchdl {

namespace {

constexpr int kPollIntervalMs = 100;

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using MultiHandle = std::unique_ptr<CURLM, decltype(&curl_multi_cleanup)>;

Error cancelledError(const std::string& url) {
    return Error(ErrorKind::Cancelled, fmt::format("Transfer of {} cancelled", url));
}

// Body of an in-flight libcurl transfer. The write callback appends to
// pending_, and read() pumps the multi handle only once pending_ is drained.
class CurlBody final : public BodyReader {
public:
    CurlBody(std::string url, Context context)
        : url_(std::move(url)),
          context_(std::move(context)),
          multi_{curl_multi_init(), &curl_multi_cleanup},
          curl_{curl_easy_init(), &curl_easy_cleanup} {
        if (!multi_ || !curl_) {
            throw Error(ErrorKind::Internal, "Failed to allocate curl handle");
        }
        error_buffer_[0] = '\0';
    }

    ~CurlBody() override {
        if (attached_) {
            curl_multi_remove_handle(multi_.get(), curl_.get());
        }
    }

    CurlBody(const CurlBody&) = delete;
    CurlBody& operator=(const CurlBody&) = delete;

    [[nodiscard]] CURL* easy() const { return curl_.get(); }

    void attach() {
        curl_easy_setopt(curl_.get(), CURLOPT_WRITEFUNCTION, &CurlBody::writeCallback);
        curl_easy_setopt(curl_.get(), CURLOPT_WRITEDATA, this);
        curl_easy_setopt(curl_.get(), CURLOPT_HEADERFUNCTION, &CurlBody::headerCallback);
        curl_easy_setopt(curl_.get(), CURLOPT_HEADERDATA, this);
        curl_easy_setopt(curl_.get(), CURLOPT_ERRORBUFFER, error_buffer_);

        const CURLMcode mc = curl_multi_add_handle(multi_.get(), curl_.get());
        if (mc != CURLM_OK) {
            throw Error(ErrorKind::Internal,
                        fmt::format("curl_multi_add_handle failed: {}", curl_multi_strerror(mc)));
        }
        attached_ = true;
    }

    // Pumps the transfer until the first body bytes arrive or it finishes.
    void awaitHeaders() {
        while (!hasPending() && !done_) {
            if (context_.cancelled()) {
                throw cancelledError(url_);
            }
            pump();
        }
        if (failure_) {
            throw Error(ErrorKind::Transport, *failure_);
        }
    }

    [[nodiscard]] long statusCode() const {
        long code = 0;
        curl_easy_getinfo(curl_.get(), CURLINFO_RESPONSE_CODE, &code);
        return code;
    }

    [[nodiscard]] std::uint64_t contentLength() const {
        curl_off_t length = -1;
        curl_easy_getinfo(curl_.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
        // -1 when the server sent no length
        return static_cast<std::uint64_t>(std::max<curl_off_t>(0, length));
    }

    [[nodiscard]] Headers takeHeaders() { return std::move(headers_); }

    ReadResult read(char* buffer, std::size_t size) override {
        while (true) {
            if (context_.cancelled()) {
                return ReadResult::failure(cancelledError(url_));
            }

            if (hasPending()) {
                const std::size_t n = std::min(size, pending_.size() - offset_);
                std::memcpy(buffer, pending_.data() + offset_, n);
                offset_ += n;
                if (offset_ == pending_.size()) {
                    pending_.clear();
                    offset_ = 0;
                }
                return ReadResult::data(n);
            }

            if (done_) {
                if (failure_) {
                    return ReadResult::failure(Error(ErrorKind::Transport, *failure_));
                }
                return ReadResult::end();
            }

            pump();
        }
    }

private:
    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* self = static_cast<CurlBody*>(userdata);
        if (!self) {
            return 0;
        }
        const size_t total = size * nmemb;
        self->pending_.append(ptr, total);
        return total;
    }

    static size_t headerCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* self = static_cast<CurlBody*>(userdata);
        const size_t total = size * nmemb;
        if (self) {
            self->addHeaderLine(std::string(ptr, total));
        }
        return total;
    }

    void addHeaderLine(std::string line) {
        while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
            line.pop_back();
        }
        // a new status line starts the headers of a redirect target
        if (line.compare(0, 5, "HTTP/") == 0) {
            headers_.clear();
            return;
        }

        const auto colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            return;
        }
        std::string name = line.substr(0, colon);
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        const auto value_start = line.find_first_not_of(" \t", colon + 1);
        headers_[name] = value_start == std::string::npos ? std::string{} : line.substr(value_start);
    }

    [[nodiscard]] bool hasPending() const { return offset_ < pending_.size(); }

    void pump() {
        int running = 0;
        CURLMcode mc = curl_multi_perform(multi_.get(), &running);
        if (mc == CURLM_OK && running == 0) {
            collectResult();
            return;
        }
        if (mc == CURLM_OK && hasPending()) {
            return;
        }
        if (mc == CURLM_OK) {
            mc = curl_multi_wait(multi_.get(), nullptr, 0, kPollIntervalMs, nullptr);
        }
        if (mc != CURLM_OK) {
            done_ = true;
            failure_ = fmt::format("curl multi error: {}", curl_multi_strerror(mc));
        }
    }

    void collectResult() {
        CURLcode result = CURLE_OK;
        int remaining = 0;
        while (CURLMsg* msg = curl_multi_info_read(multi_.get(), &remaining)) {
            if (msg->msg == CURLMSG_DONE) {
                result = msg->data.result;
            }
        }

        done_ = true;
        if (result != CURLE_OK) {
            const char* detail = error_buffer_[0] != '\0' ? error_buffer_ : curl_easy_strerror(result);
            failure_ = fmt::format("curl error: {}", detail);
        }
    }

    std::string url_;
    Context context_;
    MultiHandle multi_;
    CurlHandle curl_;
    bool attached_{false};

    Headers headers_;
    std::string pending_;
    std::size_t offset_{0};
    bool done_{false};
    std::optional<std::string> failure_;
    char error_buffer_[CURL_ERROR_SIZE];
};

} // namespace

CurlTransport::CurlTransport(ClientOptions options) : options_(std::move(options)) {}

TransportResponse CurlTransport::open(const Request& request, std::uint64_t offset,
                                      const Context& context) {
    detail::ensureCurlInitialized();
    if (context.cancelled()) {
        throw cancelledError(request.url);
    }

    auto body = std::make_unique<CurlBody>(request.url, context);
    CURL* curl = body->easy();
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, options_.follow_redirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, options_.max_redirects);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, options_.connect_timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    if (offset > 0) {
        const std::string range = fmt::format("{}-", offset);
        curl_easy_setopt(curl, CURLOPT_RANGE, range.c_str());
        spdlog::debug("Requesting {} from byte {}", request.url, offset);
    }

    body->attach();
    body->awaitHeaders();

    TransportResponse response;
    response.status_code = body->statusCode();
    response.content_length = body->contentLength();
    response.headers = body->takeHeaders();
    response.body = std::move(body);
    return response;
}

} // namespace batchdl
