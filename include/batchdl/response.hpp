#pragma once

#include "body_reader.hpp"
#include "detail/file.hpp"
#include "error.hpp"
#include "request.hpp"
#include "transport.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace batchdl {

class Client;

// State of one completed or in-progress transfer.
//
// size(), bytesTransferred(), isComplete(), progress(), duration() and
// averageBytesPerSecond() may be called from any thread at any time. Every
// other field is written by the transferring thread and is only safe to read
// once isComplete() has returned true.
class Response : public std::enable_shared_from_this<Response> {
public:
    using Clock = std::chrono::steady_clock;

    explicit Response(RequestPtr request);
    ~Response();

    Response(const Response&) = delete;
    Response& operator=(const Response&) = delete;

    [[nodiscard]] const RequestPtr& request() const noexcept { return request_; }
    [[nodiscard]] const std::string& filename() const noexcept { return filename_; }

    // Total size of the file once complete; 0 if the server did not say.
    [[nodiscard]] std::uint64_t size() const noexcept {
        return size_.load(std::memory_order_acquire);
    }
    [[nodiscard]] long statusCode() const noexcept { return status_code_; }
    // Body length announced by the server for this request, 0 if unknown.
    // Differs from size() when the transfer resumed.
    [[nodiscard]] std::uint64_t contentLength() const noexcept { return content_length_; }
    [[nodiscard]] const Headers& headers() const noexcept { return headers_; }
    [[nodiscard]] bool didResume() const noexcept { return did_resume_; }
    [[nodiscard]] Clock::time_point start() const noexcept { return start_; }
    [[nodiscard]] Clock::time_point end() const noexcept { return end_; }
    [[nodiscard]] const std::optional<Error>& error() const noexcept { return error_; }

    [[nodiscard]] bool isComplete() const noexcept;
    [[nodiscard]] bool failed() const noexcept { return isComplete() && error_.has_value(); }
    [[nodiscard]] std::uint64_t bytesTransferred() const noexcept;

    // Fraction of size() transferred so far, or 0 if the size is unknown.
    [[nodiscard]] double progress() const noexcept;

    // Time between start and end once complete. While in progress this is the
    // time since start and only approximate.
    [[nodiscard]] Clock::duration duration() const noexcept;

    // Returns 0 while duration() is zero.
    [[nodiscard]] double averageBytesPerSecond() const noexcept;

private:
    friend class Client;

    std::optional<Error> copy(BodyReader& body);
    std::optional<Error> verifyChecksum();
    std::optional<Error> close(std::optional<Error> error);

    RequestPtr request_;
    std::string filename_;
    long status_code_{0};
    std::uint64_t content_length_{0};
    Headers headers_;
    bool did_resume_{false};
    std::size_t buffer_size_{4096};

    Clock::time_point start_;
    Clock::time_point end_{};
    std::optional<Error> error_;

    detail::FilePtr writer_;
    std::shared_ptr<ResponseChannel> internal_sink_;

    std::atomic<std::uint64_t> size_{0};
    std::atomic<std::uint64_t> bytes_transferred_{0};
    std::atomic<int> done_flag_{0};
};

} // namespace batchdl
