#pragma once

#include <spdlog/common.h>

namespace batchdl {

// Installs a coloured stderr logger named "batchdl" as the spdlog default
// logger. The library itself only logs through the default logger.
void setupLogging(spdlog::level::level_enum level);

} // namespace batchdl
