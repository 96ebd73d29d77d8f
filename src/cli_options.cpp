#include "batchdl/cli_options.hpp"

#include <stdexcept>

#include <fmt/format.h>

namespace batchdl {

namespace {

constexpr std::size_t kMaxWorkers = 1024;

std::string optionName(const std::string& arg) {
    // both -dest and --dest are accepted
    if (arg.size() > 2 && arg[0] == '-' && arg[1] == '-') {
        return arg.substr(1);
    }
    return arg;
}

std::size_t parseWorkers(const std::string& value) {
    std::size_t consumed = 0;
    unsigned long long workers = 0;
    try {
        workers = std::stoull(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid worker count: " + value);
    }
    if (consumed != value.size() || value[0] == '-' || workers > kMaxWorkers) {
        throw std::invalid_argument("Invalid worker count: " + value);
    }
    return static_cast<std::size_t>(workers);
}

} // namespace

CommandLine parseCommandLine(int argc, const char* const* argv) {
    CommandLine cmd;
    int arg_index = 1;

    while (arg_index < argc && argv[arg_index][0] == '-') {
        const std::string option = optionName(argv[arg_index]);

        if (option == "-dest" || option == "-workers") {
            if (arg_index + 1 >= argc) {
                throw std::invalid_argument("Missing value for " + option);
            }
            const std::string value = argv[arg_index + 1];
            if (option == "-dest") {
                if (value.empty()) {
                    throw std::invalid_argument("Empty destination directory");
                }
                cmd.destination = value;
            } else {
                cmd.workers = parseWorkers(value);
            }
            arg_index += 2;
        } else if (option == "-v") {
            cmd.verbose = true;
            ++arg_index;
        } else if (option == "-h" || option == "-help") {
            cmd.help = true;
            return cmd;
        } else {
            throw std::invalid_argument("Unknown option: " + option);
        }
    }

    for (; arg_index < argc; ++arg_index) {
        cmd.urls.emplace_back(argv[arg_index]);
    }
    if (cmd.urls.empty()) {
        throw std::invalid_argument("At least one URL is required");
    }
    return cmd;
}

std::string usage(const char* program_name) {
    return fmt::format(
        "Usage: {} [-dest <directory>] [-workers <n>] [-v] url...\n"
        "Options:\n"
        "  -dest <directory>   Download directory (default: current directory)\n"
        "  -workers <n>        Maximum concurrent downloads, 0 for no limit (default: 0)\n"
        "  -v                  Verbose logging\n"
        "  -h, --help          Show this message\n",
        program_name);
}

} // namespace batchdl
