#include "batchdl/format.hpp"

#include <fmt/format.h>

namespace batchdl {

std::string formatSize(std::uint64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    const double value = static_cast<double>(bytes);
    if (bytes >= static_cast<std::uint64_t>(GB)) {
        return fmt::format("{:.1f} GB", value / GB);
    } else if (bytes >= static_cast<std::uint64_t>(MB)) {
        return fmt::format("{:.1f} MB", value / MB);
    } else if (bytes >= static_cast<std::uint64_t>(KB)) {
        return fmt::format("{:.1f} KB", value / KB);
    } else {
        return fmt::format("{} B", bytes);
    }
}

std::string formatRate(double bytes_per_second) {
    if (bytes_per_second <= 0.0) {
        return "0 B/s";
    }
    return formatSize(static_cast<std::uint64_t>(bytes_per_second)) + "/s";
}

} // namespace batchdl
