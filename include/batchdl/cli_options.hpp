#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace batchdl {

struct CommandLine {
    std::string destination{"."};
    // 0 runs every download at once.
    std::size_t workers{0};
    bool verbose{false};
    bool help{false};
    std::vector<std::string> urls;
};

// Parses `[-dest <dir>] [-workers <n>] [-v] [-h] url...`. Every argument after
// the options is a URL. Throws std::invalid_argument on usage errors.
[[nodiscard]] CommandLine parseCommandLine(int argc, const char* const* argv);

[[nodiscard]] std::string usage(const char* program_name);

} // namespace batchdl
