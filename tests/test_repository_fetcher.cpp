#include <gtest/gtest.h>

#include "repo/repository_fetcher.hpp"
#include "testing.hpp"

#include <memory>
#include <string>
#include <vector>

namespace fwsync {
namespace {

constexpr const char* kTreeUrl = "https://api.github.com/repos/acme/fw/git/trees/main?recursive=1";
constexpr const char* kRawBase = "https://raw.githubusercontent.com/acme/fw/main/";

class RepositoryFetcherTest : public ::testing::Test {
  protected:
    testutil::ScriptedHttpTransport transport;
    std::shared_ptr<testutil::RecordingSleeper> sleeper = std::make_shared<testutil::RecordingSleeper>();
    RequestExecutor executor{transport, RequestExecutor::Options{}, sleeper};
    RepositoryFetcher fetcher{executor};
};

TEST_F(RepositoryFetcherTest, BuildsUrlsFromOptions) {
    RepositoryFetcher::Options opt;
    opt.api_base = "https://git.example.com/api/v3";
    opt.raw_base = "https://git.example.com/raw";
    opt.branch = "release";
    RepositoryFetcher custom(executor, opt);

    RepositoryLocation repo{"git.example.com", "acme", "fw", std::nullopt};
    EXPECT_EQ(custom.TreeUrl(repo),
              "https://git.example.com/api/v3/repos/acme/fw/git/trees/release?recursive=1");
    EXPECT_EQ(custom.RawFileUrl(repo, "lib/a b.py"),
              "https://git.example.com/raw/acme/fw/release/lib/a%20b.py");
}

TEST_F(RepositoryFetcherTest, ListsOnlyBlobsInOrder) {
    transport.Respond(kTreeUrl, 200, R"({
        "sha": "abc",
        "tree": [
            {"path": "code.py", "type": "blob", "sha": "1111"},
            {"path": "assets", "type": "tree", "sha": "2222"},
            {"path": "assets/logo.bmp", "type": "blob", "sha": "3333"}
        ],
        "truncated": false
    })");

    RepositoryLocation repo;
    ASSERT_TRUE(ParseRepositoryUrl("https://github.com/acme/fw", repo).is_ok());
    std::vector<RemoteFile> files;
    auto res = fetcher.ListFiles(repo, files);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0].path, "code.py");
    EXPECT_EQ(files[0].content_digest, "1111");
    EXPECT_EQ(files[1].path, "assets/logo.bmp");

    auto sent = transport.RequestsTo(kTreeUrl);
    ASSERT_EQ(sent.size(), 1u);
    ASSERT_NE(sent[0].FindHeader("Accept"), nullptr);
    EXPECT_EQ(sent[0].FindHeader("Accept")->value, "application/vnd.github+json");
    EXPECT_EQ(sent[0].FindHeader("Authorization"), nullptr);
}

TEST_F(RepositoryFetcherTest, EmptyTreeIsEmptyRepository) {
    transport.Respond(kTreeUrl, 200, R"({"tree": []})");

    std::unique_ptr<IFileStream> stream;
    auto res = fetcher.Open("https://github.com/acme/fw", stream);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.code(), ErrorCode::EmptyRepository);
    EXPECT_EQ(res.msg, "Repository is empty. Does 'main' branch exist?");
    EXPECT_EQ(stream, nullptr);
}

TEST_F(RepositoryFetcherTest, MissingBranchIsEmptyRepository) {
    // Unscripted URLs answer 404.
    std::unique_ptr<IFileStream> stream;
    auto res = fetcher.Open("https://github.com/acme/fw", stream);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.code(), ErrorCode::EmptyRepository);
    EXPECT_EQ(transport.requests.size(), 1u);
}

TEST_F(RepositoryFetcherTest, InvalidUrlMakesNoRequest) {
    std::unique_ptr<IFileStream> stream;
    auto res = fetcher.Open("not a url", stream);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.code(), ErrorCode::InvalidRepositoryUrl);
    EXPECT_TRUE(transport.requests.empty());
}

TEST_F(RepositoryFetcherTest, TreeEntryWithoutShaIsProtocolError) {
    transport.Respond(kTreeUrl, 200, R"({"tree": [{"path": "code.py", "type": "blob"}]})");

    std::unique_ptr<IFileStream> stream;
    auto res = fetcher.Open("https://github.com/acme/fw", stream);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.code(), ErrorCode::Protocol);
}

TEST_F(RepositoryFetcherTest, StreamDownloadsLazilyWithCredentials) {
    transport.Respond(kTreeUrl, 200, R"({"tree": [
        {"path": "code.py", "type": "blob", "sha": "aaaa"},
        {"path": "assets/logo.bmp", "type": "blob", "sha": "bbbb"}
    ]})");
    transport.Respond(std::string(kRawBase) + "code.py", 200, "print('hi')\n");
    transport.Respond(std::string(kRawBase) + "assets/logo.bmp", 200, "BM");

    std::unique_ptr<IFileStream> stream;
    auto res = fetcher.Open("https://github.com/acme/fw/secret-token", stream);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    ASSERT_NE(stream, nullptr);
    EXPECT_EQ(stream->FileCount(), 2u);
    EXPECT_EQ(transport.requests.size(), 1u);

    DownloadedFile file;
    bool eof = true;
    ASSERT_TRUE(stream->Next(file, eof).is_ok());
    ASSERT_FALSE(eof);
    EXPECT_EQ(file.file.path, "code.py");
    EXPECT_EQ(file.file.content_digest, "aaaa");
    EXPECT_EQ(file.bytes, "print('hi')\n");
    EXPECT_EQ(file.Bytes().size(), file.bytes.size());
    EXPECT_EQ(static_cast<const void*>(file.Bytes().data()), static_cast<const void*>(file.bytes.data()));
    EXPECT_EQ(transport.requests.size(), 2u);

    ASSERT_TRUE(stream->Next(file, eof).is_ok());
    ASSERT_FALSE(eof);
    EXPECT_EQ(file.file.path, "assets/logo.bmp");

    ASSERT_TRUE(stream->Next(file, eof).is_ok());
    EXPECT_TRUE(eof);

    ASSERT_EQ(transport.requests.size(), 3u);
    for (const auto& sent : transport.requests) {
        const HttpHeader* auth = sent.FindHeader("Authorization");
        ASSERT_NE(auth, nullptr) << sent.url;
        EXPECT_EQ(auth->value, "Bearer secret-token");
    }
}

TEST(DownloadedFileTest, ReleaseBytesDropsTheBuffer) {
    DownloadedFile file;
    file.bytes.assign(64 * 1024, 'x');
    ASSERT_EQ(file.Bytes().size(), 64u * 1024u);

    file.ReleaseBytes();
    EXPECT_TRUE(file.bytes.empty());
    EXPECT_LT(file.bytes.capacity(), 64u * 1024u);
    EXPECT_TRUE(file.Bytes().empty());
}

TEST_F(RepositoryFetcherTest, FailedDownloadNamesThePath) {
    transport.Respond(kTreeUrl, 200, R"({"tree": [{"path": "code.py", "type": "blob", "sha": "aaaa"}]})");
    transport.Respond(std::string(kRawBase) + "code.py", 403, "forbidden");

    std::unique_ptr<IFileStream> stream;
    ASSERT_TRUE(fetcher.Open("https://github.com/acme/fw", stream).is_ok());

    DownloadedFile file;
    bool eof = false;
    auto res = stream->Next(file, eof);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.code(), ErrorCode::Protocol);
    EXPECT_NE(res.msg.find("download code.py"), std::string::npos);
}

} // namespace
} // namespace fwsync
