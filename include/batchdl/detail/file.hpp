#pragma once

#include <cstdio>
#include <memory>

namespace batchdl::detail {

struct FileDeleter {
    void operator()(FILE* fp) const noexcept {
        if (fp) {
            std::fclose(fp);
        }
    }
};

using FilePtr = std::unique_ptr<FILE, FileDeleter>;

} // namespace batchdl::detail
