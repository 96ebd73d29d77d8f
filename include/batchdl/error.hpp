#pragma once

#include <stdexcept>
#include <string>

namespace batchdl {

enum class ErrorKind {
    Transport,
    BadStatus,
    Filesystem,
    ChecksumMismatch,
    Cancelled,
    InvalidRequest,
    Internal
};

[[nodiscard]] const char* toString(ErrorKind kind) noexcept;

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message, std::string digest = {});

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

    // Hex digest of the downloaded file, only set for ChecksumMismatch.
    [[nodiscard]] const std::string& digest() const noexcept { return digest_; }

private:
    ErrorKind kind_;
    std::string digest_;
};

} // namespace batchdl
