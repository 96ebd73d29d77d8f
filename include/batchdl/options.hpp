#pragma once

#include <cstddef>
#include <string>

namespace batchdl {

struct ClientOptions {
    // Chunk size of the copy loop and the verification read.
    std::size_t buffer_size{4096};
    std::string user_agent{"batchdl/1.0"};
    long connect_timeout_seconds{30};
    bool follow_redirects{true};
    long max_redirects{10};
};

} // namespace batchdl
