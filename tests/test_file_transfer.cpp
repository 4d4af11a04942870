#include <gtest/gtest.h>
#include "core/file_transfer.hpp"
#include "fake_http_client.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

class FileTransferTest : public ::testing::Test {
protected:
    std::string test_dir;
    FakeHttpClient http;

    void SetUp() override {
        test_dir = (fs::temp_directory_path() / "vidgrab-test-transfer").string();
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    TransferOptions options() {
        TransferOptions o;
        o.download_dir = test_dir;
        return o;
    }

    static std::string read_file(const std::string& path) {
        std::ifstream in(path, std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    size_t file_count() const {
        size_t n = 0;
        for (const auto& entry : fs::directory_iterator(test_dir)) {
            (void)entry;
            n++;
        }
        return n;
    }
};

// ── Filename derivation ─────────────────────────────────────

TEST(FileTransferNameTest, LastPathSegment) {
    EXPECT_EQ(FileTransferEngine::derive_filename(
                  "https://github.com/o/r/releases/download/v2.3.0/VidGrab-Setup-2.3.0.exe"),
              "VidGrab-Setup-2.3.0.exe");
}

TEST(FileTransferNameTest, FilenameQueryParameter) {
    EXPECT_EQ(FileTransferEngine::derive_filename(
                  "https://objects.example.com/blob/abc?filename=VidGrab%20Setup.exe&sig=x"),
              "VidGrab Setup.exe");
}

TEST(FileTransferNameTest, ContentDispositionParameter) {
    EXPECT_EQ(FileTransferEngine::derive_filename(
                  "https://objects.example.com/blob/abc?response-content-disposition="
                  "attachment%3B%20filename%3DVidGrab.dmg"),
              "VidGrab.dmg");
}

TEST(FileTransferNameTest, QuotedContentDispositionFilename) {
    EXPECT_EQ(FileTransferEngine::derive_filename(
                  "https://objects.example.com/blob/abc?response-content-disposition="
                  "attachment%3B%20filename%3D%22VidGrab-2.3.0.AppImage%22&sig=x"),
              "VidGrab-2.3.0.AppImage");
}

TEST(FileTransferNameTest, LongOrMissingSegmentFallsBack) {
    std::string long_name(120, 'a');
    EXPECT_EQ(FileTransferEngine::derive_filename("https://example.com/" + long_name), "update");
    EXPECT_EQ(FileTransferEngine::derive_filename("https://example.com/"), "update");
}

TEST(FileTransferNameTest, TraversalStripped) {
    EXPECT_EQ(FileTransferEngine::derive_filename(
                  "https://example.com/x?filename=..%2F..%2Fetc%2Fpasswd"),
              "passwd");
    EXPECT_EQ(FileTransferEngine::derive_filename("https://example.com/x?filename=.."), "x");
}

// ── Downloads ───────────────────────────────────────────────

TEST_F(FileTransferTest, DownloadsBodyAndReportsProgress) {
    const std::string url = "https://example.com/VidGrab-Setup.exe";
    FakeResponse response;
    response.chunks = {std::string(25, 'a'), std::string(25, 'b'),
                       std::string(25, 'c'), std::string(25, 'd')};
    http.route(url, response);

    std::vector<UpdateProgress> updates;
    FileTransferEngine engine(http, options());
    auto result = engine.download(url, [&](const UpdateProgress& p) { updates.push_back(p); });

    ASSERT_TRUE(result.success) << result.error.message;
    EXPECT_EQ(result.path, (fs::path(test_dir) / "VidGrab-Setup.exe").string());
    EXPECT_EQ(read_file(result.path).size(), 100u);

    ASSERT_EQ(updates.size(), 4u);
    EXPECT_EQ(updates[0].percent, 25);
    EXPECT_EQ(updates[0].total, 100);
    EXPECT_EQ(updates[3].percent, 100);
    EXPECT_EQ(updates[3].transferred, 100);
    for (size_t i = 1; i < updates.size(); i++) {
        EXPECT_GE(updates[i].percent, updates[i - 1].percent);
    }
}

TEST_F(FileTransferTest, UnknownLengthReportsZeroPercent) {
    const std::string url = "https://example.com/stream.bin";
    FakeResponse response = FakeResponse::ok("payload");
    response.auto_content_length = false;
    http.route(url, response);

    UpdateProgress last;
    FileTransferEngine engine(http, options());
    auto result = engine.download(url, [&](const UpdateProgress& p) { last = p; });

    ASSERT_TRUE(result.success);
    EXPECT_EQ(last.percent, 0);
    EXPECT_EQ(last.total, 0);
    EXPECT_EQ(last.transferred, 7);
}

TEST_F(FileTransferTest, SendsUserAgent) {
    const std::string url = "https://example.com/a.exe";
    http.route(url, FakeResponse::ok("x"));
    FileTransferEngine engine(http, options());
    engine.download(url);

    auto requests = http.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].header("User-Agent"), "VidGrab-Updater");
}

TEST_F(FileTransferTest, RedirectKeepsOnlyFinalFile) {
    const std::string a = "https://github.com/o/r/releases/download/v1/app.exe";
    const std::string b = "https://objects.example.com/blob/1?filename=VidGrab-Setup.exe";
    http.route(a, FakeResponse::redirect(b));
    http.route(b, FakeResponse::ok("final-content"));

    FileTransferEngine engine(http, options());
    auto result = engine.download(a);

    ASSERT_TRUE(result.success) << result.error.message;
    EXPECT_EQ(result.redirects, 1);
    EXPECT_EQ(fs::path(result.path).filename().string(), "VidGrab-Setup.exe");
    EXPECT_EQ(read_file(result.path), "final-content");
    EXPECT_FALSE(fs::exists(fs::path(test_dir) / "app.exe"));
    EXPECT_EQ(file_count(), 1u);
}

TEST_F(FileTransferTest, RelativeRedirect) {
    const std::string a = "https://example.com/dl/latest";
    http.route(a, FakeResponse::redirect("/files/VidGrab.dmg", 301));
    http.route("https://example.com/files/VidGrab.dmg", FakeResponse::ok("dmg"));

    FileTransferEngine engine(http, options());
    auto result = engine.download(a);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(fs::path(result.path).filename().string(), "VidGrab.dmg");
}

TEST_F(FileTransferTest, RedirectLimit) {
    for (int i = 0; i < 5; i++) {
        http.route("https://example.com/r" + std::to_string(i),
                   FakeResponse::redirect("https://example.com/r" + std::to_string(i + 1)));
    }

    TransferOptions o = options();
    o.max_redirects = 2;
    FileTransferEngine engine(http, o);
    auto result = engine.download("https://example.com/r0");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.kind, UpdateErrorKind::Http);
    EXPECT_EQ(result.error.message, "Too many redirects");
    EXPECT_EQ(http.requests().size(), 3u);
    EXPECT_EQ(file_count(), 0u);
}

TEST_F(FileTransferTest, HttpErrorRemovesFile) {
    const std::string url = "https://example.com/missing.exe";
    http.route(url, FakeResponse::status_only(404));

    FileTransferEngine engine(http, options());
    auto result = engine.download(url);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.kind, UpdateErrorKind::Http);
    EXPECT_EQ(result.error.http_status, 404);
    EXPECT_EQ(result.error.message, "Download failed with status 404");
    EXPECT_EQ(file_count(), 0u);
}

TEST_F(FileTransferTest, TransportTimeout) {
    const std::string url = "https://example.com/slow.exe";
    http.route(url, FakeResponse::failure(TransportError::Timeout));

    FileTransferEngine engine(http, options());
    auto result = engine.download(url);

    EXPECT_EQ(result.error.kind, UpdateErrorKind::Timeout);
    EXPECT_EQ(result.error.message, "Download timeout");
    EXPECT_EQ(file_count(), 0u);
}

TEST_F(FileTransferTest, ExpiredDeadlineMakesNoRequest) {
    TransferOptions o = options();
    o.timeout = std::chrono::milliseconds(0);
    FileTransferEngine engine(http, o);

    auto result = engine.download("https://example.com/a.exe");
    EXPECT_EQ(result.error.kind, UpdateErrorKind::Timeout);
    EXPECT_TRUE(http.requests().empty());
}

TEST_F(FileTransferTest, PassesRemainingDeadlineToTransport) {
    const std::string url = "https://example.com/a.exe";
    http.route(url, FakeResponse::ok("x"));
    FileTransferEngine engine(http, options());
    engine.download(url);

    auto requests = http.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_LE(requests[0].timeout, std::chrono::milliseconds(300000));
    EXPECT_GT(requests[0].timeout, std::chrono::milliseconds(290000));
}

TEST_F(FileTransferTest, TruncatedBodyIsError) {
    const std::string url = "https://example.com/a.exe";
    FakeResponse response = FakeResponse::ok("only-ten!!");
    response.headers["content-length"] = "100";
    http.route(url, response);

    FileTransferEngine engine(http, options());
    auto result = engine.download(url);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.kind, UpdateErrorKind::Network);
    EXPECT_EQ(file_count(), 0u);
}

TEST_F(FileTransferTest, ConnectionDroppedMidBody) {
    const std::string url = "https://example.com/a.exe";
    FakeResponse response = FakeResponse::ok("partial");
    response.error = TransportError::Connection;
    response.error_message = "Failed to read connection";
    http.route(url, response);

    FileTransferEngine engine(http, options());
    auto result = engine.download(url);
    EXPECT_EQ(result.error.kind, UpdateErrorKind::Network);
    EXPECT_EQ(file_count(), 0u);
}

TEST_F(FileTransferTest, CancelMidTransferRemovesPartial) {
    const std::string url = "https://example.com/big.exe";
    FakeResponse response;
    for (int i = 0; i < 10; i++) response.chunks.push_back(std::string(64, 'z'));
    http.route(url, response);

    std::atomic<bool> cancel{false};
    http.on_chunk = [&](const std::string&, size_t index) {
        if (index == 3) cancel.store(true);
    };

    int progress_calls = 0;
    FileTransferEngine engine(http, options());
    auto result = engine.download(url, [&](const UpdateProgress&) { progress_calls++; }, &cancel);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.kind, UpdateErrorKind::Cancelled);
    EXPECT_EQ(progress_calls, 3);
    EXPECT_EQ(file_count(), 0u);
}

TEST_F(FileTransferTest, CancelledBeforeStart) {
    std::atomic<bool> cancel{true};
    FileTransferEngine engine(http, options());
    auto result = engine.download("https://example.com/a.exe", nullptr, &cancel);
    EXPECT_EQ(result.error.kind, UpdateErrorKind::Cancelled);
    EXPECT_TRUE(http.requests().empty());
}
