#include "batchdl/logging.hpp"

#include <memory>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace batchdl {

void setupLogging(spdlog::level::level_enum level) {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    sink->set_pattern("\033[36m[%Y-%m-%d %H:%M:%S.%e] \033[92m[%n] \033[0m%^[%l]%$ %v");

    auto logger = std::make_shared<spdlog::logger>("batchdl", sink);
    logger->set_level(level);
    spdlog::set_default_logger(std::move(logger));
}

} // namespace batchdl
