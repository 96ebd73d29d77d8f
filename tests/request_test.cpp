#include "batchdl/error.hpp"
#include "batchdl/request.hpp"

#include <gtest/gtest.h>

#include <filesystem>

using namespace batchdl;

TEST(FilenameFromUrl, UsesLastPathSegment) {
    EXPECT_EQ(filenameFromUrl("http://example.com/a/b/file.tar.gz"), "file.tar.gz");
    EXPECT_EQ(filenameFromUrl("https://example.com/file.iso?token=1#top"), "file.iso");
    EXPECT_EQ(filenameFromUrl("http://example.com/my%20file.txt"), "my file.txt");
    EXPECT_EQ(filenameFromUrl("file:///tmp/source.bin"), "source.bin");
}

TEST(FilenameFromUrl, FallsBackToIndexForDirectories) {
    EXPECT_EQ(filenameFromUrl("http://example.com"), "index.html");
    EXPECT_EQ(filenameFromUrl("http://example.com/"), "index.html");
    EXPECT_EQ(filenameFromUrl("http://example.com/docs/"), "index.html");
}

TEST(FilenameFromUrl, RejectsGarbage) {
    try {
        (void)filenameFromUrl("not a url");
        FAIL() << "expected an error";
    } catch (const Error& err) {
        EXPECT_EQ(err.kind(), ErrorKind::InvalidRequest);
    }
}

TEST(MakeRequest, JoinsDestinationAndFilename) {
    const Request request = makeRequest("downloads", "http://example.com/pkg/data.zip");

    EXPECT_EQ(request.url, "http://example.com/pkg/data.zip");
    EXPECT_EQ(request.filename, (std::filesystem::path{"downloads"} / "data.zip").string());
    EXPECT_FALSE(request.hash.has_value());
    EXPECT_TRUE(request.checksum.empty());
    EXPECT_FALSE(request.remove_on_error);
    EXPECT_FALSE(request.no_resume);
    EXPECT_EQ(request.notify_on_close, nullptr);
}

TEST(MakeRequest, AcceptsFileUrlsWithoutHost) {
    EXPECT_NO_THROW((void)makeRequest(".", "file:///var/tmp/blob.bin"));
}

TEST(MakeRequest, RejectsInvalidUrls) {
    EXPECT_THROW((void)makeRequest(".", ""), Error);
    EXPECT_THROW((void)makeRequest(".", "not a url"), Error);
}
