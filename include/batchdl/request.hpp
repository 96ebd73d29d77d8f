#pragma once

#include "channel.hpp"
#include "hash.hpp"

#include <memory>
#include <optional>
#include <string>

namespace batchdl {

class Response;
using ResponsePtr = std::shared_ptr<Response>;
using ResponseChannel = Channel<ResponsePtr>;

// Description of one download. Shared read-only between the caller, the client
// and the resulting Response.
struct Request {
    std::string url;
    std::string filename;

    // Checksum verification runs only when both are set.
    std::optional<HashAlgorithm> hash;
    Digest checksum;

    // Delete the destination file when checksum verification fails.
    bool remove_on_error{false};

    // Always start from byte 0, truncating any existing destination file.
    bool no_resume{false};

    // Receives the Response once it is finalized. Must be drained by its owner.
    std::shared_ptr<ResponseChannel> notify_on_close;
};

using RequestPtr = std::shared_ptr<const Request>;

// Last segment of the URL path, or "index.html" when the path is empty or ends
// with '/'. Throws Error(InvalidRequest) if the URL cannot be parsed.
[[nodiscard]] std::string filenameFromUrl(const std::string& url);

// Builds a request that downloads `url` into `destination_dir`. Throws
// Error(InvalidRequest) if the URL cannot be parsed or has no host.
[[nodiscard]] Request makeRequest(const std::string& destination_dir, const std::string& url);

} // namespace batchdl
