#pragma once

#include <cstdint>
#include <string>

namespace batchdl {

// Human readable byte count: "512 B", "1.5 KB", "3.2 MB", "1.0 GB".
[[nodiscard]] std::string formatSize(std::uint64_t bytes);

[[nodiscard]] std::string formatRate(double bytes_per_second);

} // namespace batchdl
