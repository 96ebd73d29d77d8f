#include "batchdl/error.hpp"

#include <utility>

namespace batchdl {

const char* toString(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::Transport:
        return "transport";
    case ErrorKind::BadStatus:
        return "bad status";
    case ErrorKind::Filesystem:
        return "filesystem";
    case ErrorKind::ChecksumMismatch:
        return "checksum mismatch";
    case ErrorKind::Cancelled:
        return "cancelled";
    case ErrorKind::InvalidRequest:
        return "invalid request";
    case ErrorKind::Internal:
        return "internal";
    }
    return "unknown";
}

Error::Error(ErrorKind kind, const std::string& message, std::string digest)
    : std::runtime_error(message), kind_(kind), digest_(std::move(digest)) {}

} // namespace batchdl
