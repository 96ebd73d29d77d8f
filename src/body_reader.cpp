#include "batchdl/body_reader.hpp"

#include <algorithm>
#include <cstring>
#include <utility>

namespace batchdl {

MemoryBody::MemoryBody(std::string content) : content_(std::move(content)) {}

ReadResult MemoryBody::read(char* buffer, std::size_t size) {
    const std::size_t n = std::min(size, content_.size() - offset_);
    if (n > 0) {
        std::memcpy(buffer, content_.data() + offset_, n);
        offset_ += n;
    }
    return ReadResult::data(n, offset_ == content_.size());
}

} // namespace batchdl
