#include "batchdl/response.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace batchdl {

Response::Response(RequestPtr request)
    : request_(std::move(request)), start_(Clock::now()) {
    if (request_) {
        filename_ = request_->filename;
    }
}

Response::~Response() = default;

bool Response::isComplete() const noexcept {
    return done_flag_.load(std::memory_order_acquire) > 0;
}

std::uint64_t Response::bytesTransferred() const noexcept {
    return bytes_transferred_.load(std::memory_order_acquire);
}

double Response::progress() const noexcept {
    const std::uint64_t total = size();
    if (total == 0) {
        return 0.0;
    }
    return static_cast<double>(bytesTransferred()) / static_cast<double>(total);
}

Response::Clock::duration Response::duration() const noexcept {
    if (isComplete()) {
        return end_ - start_;
    }
    return Clock::now() - start_;
}

double Response::averageBytesPerSecond() const noexcept {
    const double seconds = std::chrono::duration<double>(duration()).count();
    if (seconds <= 0.0) {
        return 0.0;
    }
    return static_cast<double>(bytesTransferred()) / seconds;
}

std::optional<Error> Response::copy(BodyReader& body) {
    if (!writer_) {
        return close(Error(ErrorKind::Filesystem,
                           fmt::format("Destination {} is not open for writing", filename_)));
    }

    std::vector<char> buffer(buffer_size_ > 0 ? buffer_size_ : 4096);
    bool complete = false;
    while (!complete) {
        ReadResult result = body.read(buffer.data(), buffer.size());
        if (result.error) {
            return close(std::move(result.error));
        }

        if (result.bytes > 0) {
            const std::size_t written = std::fwrite(buffer.data(), 1, result.bytes, writer_.get());
            if (written != result.bytes) {
                return close(Error(ErrorKind::Filesystem,
                                   fmt::format("Failed to write {}: {}", filename_,
                                               std::strerror(errno))));
            }
            bytes_transferred_.fetch_add(written, std::memory_order_release);
        }

        complete = result.eof;
    }

    // the file must be fully flushed before it is re-read for verification
    if (std::fclose(writer_.release()) != 0) {
        return close(Error(ErrorKind::Filesystem,
                           fmt::format("Failed to close {}: {}", filename_, std::strerror(errno))));
    }

    if (request_->hash && !request_->checksum.empty()) {
        if (auto err = verifyChecksum()) {
            return close(std::move(err));
        }
    }

    return close(std::nullopt);
}

std::optional<Error> Response::verifyChecksum() {
    Digest sum;
    try {
        sum = hashFile(filename_, *request_->hash, buffer_size_);
    } catch (const Error& err) {
        return err;
    }

    if (sum != request_->checksum) {
        if (request_->remove_on_error && std::remove(filename_.c_str()) != 0) {
            spdlog::warn("Failed to remove {} after checksum mismatch: {}", filename_,
                         std::strerror(errno));
        }
        const std::string hex = toHex(sum);
        return Error(ErrorKind::ChecksumMismatch, fmt::format("Checksum mismatch: {}", hex), hex);
    }
    return std::nullopt;
}

std::optional<Error> Response::close(std::optional<Error> error) {
    writer_.reset();

    error_ = std::move(error);
    end_ = Clock::now();
    done_flag_.fetch_add(1, std::memory_order_acq_rel);

    const auto self = shared_from_this();
    if (internal_sink_) {
        internal_sink_->send(self);
    }
    if (request_ && request_->notify_on_close) {
        request_->notify_on_close->send(self);
    }

    return error_;
}

} // namespace batchdl
