#include "batchdl/cli_options.hpp"
#include "batchdl/format.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

using namespace batchdl;

namespace {

CommandLine parse(std::vector<const char*> args) {
    args.insert(args.begin(), "batchdl");
    return parseCommandLine(static_cast<int>(args.size()), args.data());
}

} // namespace

TEST(CommandLine, EveryPositionalArgumentIsAUrl) {
    const auto cmd = parse({"http://a.example/1.bin", "http://b.example/2.bin"});

    ASSERT_EQ(cmd.urls.size(), 2u);
    EXPECT_EQ(cmd.urls[0], "http://a.example/1.bin");
    EXPECT_EQ(cmd.urls[1], "http://b.example/2.bin");
}

TEST(CommandLine, SingleUrlIsKept) {
    const auto cmd = parse({"http://a.example/1.bin"});

    ASSERT_EQ(cmd.urls.size(), 1u);
    EXPECT_EQ(cmd.destination, ".");
    EXPECT_EQ(cmd.workers, 0u);
    EXPECT_FALSE(cmd.verbose);
}

TEST(CommandLine, ParsesOptions) {
    const auto cmd = parse({"-dest", "out", "-workers", "4", "-v", "http://a.example/1.bin"});

    EXPECT_EQ(cmd.destination, "out");
    EXPECT_EQ(cmd.workers, 4u);
    EXPECT_TRUE(cmd.verbose);
    EXPECT_EQ(cmd.urls.size(), 1u);
}

TEST(CommandLine, AcceptsDoubleDashOptions) {
    const auto cmd = parse({"--dest", "out", "http://a.example/1.bin"});

    EXPECT_EQ(cmd.destination, "out");
}

TEST(CommandLine, HelpStopsParsing) {
    EXPECT_TRUE(parse({"-h"}).help);
    EXPECT_TRUE(parse({"--help"}).help);
}

TEST(CommandLine, RejectsUsageErrors) {
    EXPECT_THROW(parse({}), std::invalid_argument);
    EXPECT_THROW(parse({"-dest", "out"}), std::invalid_argument);
    EXPECT_THROW(parse({"-dest"}), std::invalid_argument);
    EXPECT_THROW(parse({"-workers", "abc", "http://a.example/1"}), std::invalid_argument);
    EXPECT_THROW(parse({"-workers", "-1", "http://a.example/1"}), std::invalid_argument);
    EXPECT_THROW(parse({"-bogus", "http://a.example/1"}), std::invalid_argument);
}

TEST(FormatSize, PicksUnit) {
    EXPECT_EQ(formatSize(512), "512 B");
    EXPECT_EQ(formatSize(1536), "1.5 KB");
    EXPECT_EQ(formatSize(3ULL * 1024 * 1024), "3.0 MB");
    EXPECT_EQ(formatSize(5ULL * 1024 * 1024 * 1024), "5.0 GB");
    EXPECT_EQ(formatRate(0.0), "0 B/s");
    EXPECT_EQ(formatRate(2048.0), "2.0 KB/s");
}
