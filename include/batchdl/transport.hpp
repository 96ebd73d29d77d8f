#pragma once

#include "body_reader.hpp"
#include "context.hpp"
#include "request.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <string>

namespace batchdl {

// Response header fields keyed by lower-case name. A repeated field keeps its
// last value.
using Headers = std::map<std::string, std::string>;

struct TransportResponse {
    // HTTP status, or 0 for schemes without one (file://, ftp://).
    long status_code{0};
    // Length of the body that follows, 0 if unknown.
    std::uint64_t content_length{0};
    // Headers of the final response after redirects; empty for schemes
    // without headers.
    Headers headers;
    std::unique_ptr<BodyReader> body;
};

class Transport {
public:
    virtual ~Transport() = default;

    // Issues the request for `request.url`, asking for the bytes from `offset`
    // onward when `offset` is non-zero, and returns once the response headers
    // are available. Throws Error(Transport) or Error(Cancelled).
    virtual TransportResponse open(const Request& request, std::uint64_t offset,
                                   const Context& context) = 0;
};

} // namespace batchdl
