#include "batchdl/cli_options.hpp"
#include "batchdl/client.hpp"
#include "batchdl/detail/curl_utils.hpp"
#include "batchdl/format.hpp"
#include "batchdl/logging.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <system_error>

#include <fmt/format.h>

namespace {

constexpr int kMaxExitCode = 255;

void printResult(const batchdl::Response& response) {
    if (const auto& err = response.error()) {
        std::cerr << fmt::format("{}: {}", response.request()->url, err->what()) << std::endl;
        return;
    }

    const std::filesystem::path path{response.filename()};
    std::cout << fmt::format("{:<32} {:>10}  {}{}", path.filename().string(),
                             batchdl::formatSize(response.bytesTransferred()),
                             batchdl::formatRate(response.averageBytesPerSecond()),
                             response.didResume() ? "  (resumed)" : "")
              << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    batchdl::CommandLine cmd;
    try {
        cmd = batchdl::parseCommandLine(argc, argv);
    } catch (const std::invalid_argument& ex) {
        std::cerr << ex.what() << "\n" << batchdl::usage(argv[0]);
        return 1;
    }
    if (cmd.help) {
        std::cout << batchdl::usage(argv[0]);
        return 0;
    }

    batchdl::setupLogging(cmd.verbose ? spdlog::level::debug : spdlog::level::warn);

    try {
        batchdl::detail::ensureCurlInitialized();

        std::error_code ec;
        std::filesystem::create_directories(cmd.destination, ec);
        if (ec) {
            throw std::runtime_error("Failed to create download directory: " + cmd.destination +
                                     " - " + ec.message());
        }

        batchdl::Client client;
        batchdl::Context context;
        auto results = client.batch(context, cmd.workers, cmd.destination, cmd.urls);

        // the exit code is the number of failed downloads
        int failed = 0;
        while (auto response = results->receive()) {
            printResult(**response);
            if ((*response)->error()) {
                ++failed;
            }
        }
        return std::min(failed, kMaxExitCode);
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
}
