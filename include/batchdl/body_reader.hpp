#pragma once

#include "error.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>

namespace batchdl {

// Outcome of a single BodyReader::read(). `bytes` may be non-zero together
// with `eof`; a zero-byte read without `eof` is not the end of the stream.
struct ReadResult {
    std::size_t bytes{0};
    bool eof{false};
    std::optional<Error> error;

    static ReadResult data(std::size_t n, bool end = false) { return {n, end, std::nullopt}; }
    static ReadResult end() { return {0, true, std::nullopt}; }
    static ReadResult failure(Error err) { return {0, false, std::move(err)}; }
};

// Pull interface over a response body. The body is consumed exactly once.
class BodyReader {
public:
    virtual ~BodyReader() = default;

    virtual ReadResult read(char* buffer, std::size_t size) = 0;
};

class MemoryBody final : public BodyReader {
public:
    explicit MemoryBody(std::string content = {});

    ReadResult read(char* buffer, std::size_t size) override;

private:
    std::string content_;
    std::size_t offset_{0};
};

} // namespace batchdl
