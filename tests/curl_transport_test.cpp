#include "batchdl/client.hpp"
#include "batchdl/curl_transport.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace batchdl;
using namespace batchdl::test;

namespace {

std::string fileUrl(const std::string& path) {
    return "file://" + fs::absolute(path).string();
}

class CurlTransportTest : public ::testing::Test {
protected:
    std::string serveFile(const std::string& name, const std::string& content) {
        const auto path = source_dir_.file(name);
        writeFile(path, content);
        return fileUrl(path);
    }

    TempDir source_dir_;
    TempDir dest_dir_;
    Client client_;
};

} // namespace

TEST_F(CurlTransportTest, DownloadsLocalFile) {
    const auto content = makeContent(10000);
    const auto url = serveFile("source.bin", content);
    const auto request = makeTestRequest(url, dest_dir_.file("source.bin"), [&](Request& r) {
        r.hash = HashAlgorithm::Sha256;
        r.checksum = sha256Of(content);
    });

    const auto response = client_.execute(request);

    ASSERT_FALSE(response->error().has_value()) << response->error()->what();
    EXPECT_TRUE(response->isComplete());
    EXPECT_EQ(response->bytesTransferred(), 10000u);
    EXPECT_FALSE(response->didResume());
    EXPECT_EQ(readFile(request->filename), content);
}

TEST_F(CurlTransportTest, MissingSourceIsTransportError) {
    const auto request =
        makeTestRequest(fileUrl(source_dir_.file("absent.bin")), dest_dir_.file("absent.bin"));

    const auto response = client_.execute(request);

    ASSERT_TRUE(response->failed());
    EXPECT_EQ(response->error()->kind(), ErrorKind::Transport);
}

TEST_F(CurlTransportTest, ResumesPartialDownload) {
    const auto content = makeContent(10000);
    const auto url = serveFile("source.bin", content);
    const auto destination = dest_dir_.file("source.bin");
    writeFile(destination, content.substr(0, 3000));

    const auto response = client_.execute(makeTestRequest(url, destination));

    ASSERT_FALSE(response->error().has_value()) << response->error()->what();
    EXPECT_TRUE(response->didResume());
    EXPECT_EQ(response->bytesTransferred(), 10000u);
    EXPECT_EQ(readFile(destination), content);
}

TEST_F(CurlTransportTest, CancelledContextFails) {
    const auto url = serveFile("source.bin", makeContent(100));
    Context context;
    context.cancel();

    const auto response = client_.execute(makeTestRequest(url, dest_dir_.file("out.bin")), context);

    ASSERT_TRUE(response->failed());
    EXPECT_EQ(response->error()->kind(), ErrorKind::Cancelled);
}

TEST_F(CurlTransportTest, OpenRejectsCancelledContext) {
    CurlTransport transport{ClientOptions{}};
    const auto url = serveFile("source.bin", makeContent(100));
    Context context;
    context.cancel();

    Request request;
    request.url = url;
    request.filename = dest_dir_.file("out.bin");
    EXPECT_THROW((void)transport.open(request, 0, context), Error);
}

TEST_F(CurlTransportTest, BatchOfLocalFiles) {
    const auto first = serveFile("one.bin", makeContent(4096, 1));
    const auto second = serveFile("two.bin", makeContent(2048, 2));

    auto results = client_.batch(Context{}, 1, dest_dir_.path().string(), {first, second});

    std::size_t count = 0;
    while (auto response = results->receive()) {
        ++count;
        EXPECT_FALSE((*response)->error().has_value());
    }
    EXPECT_EQ(count, 2u);
    EXPECT_EQ(readFile(dest_dir_.file("one.bin")), makeContent(4096, 1));
    EXPECT_EQ(readFile(dest_dir_.file("two.bin")), makeContent(2048, 2));
}
