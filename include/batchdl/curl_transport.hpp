#pragma once

#include "options.hpp"
#include "transport.hpp"

namespace batchdl {

// Transport backed by libcurl. Each open() drives its own easy handle through a
// private multi handle so that the body can be pulled chunk by chunk.
class CurlTransport final : public Transport {
public:
    explicit CurlTransport(ClientOptions options = {});

    TransportResponse open(const Request& request, std::uint64_t offset,
                           const Context& context) override;

private:
    ClientOptions options_;
};

} // namespace batchdl
