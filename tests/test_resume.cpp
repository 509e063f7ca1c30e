// test_resume.cpp: pause, resume tokens and their single-use guarantee

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

#include "fake_transport.hpp"
#include "transferkit/transfer_manager.hpp"

using namespace transferkit;
using transferkit::test::FakeTransport;
namespace fs = std::filesystem;

namespace {

constexpr char kUrl[] = "https://example.com/media/video.mp4";

std::string patternBody(std::size_t size) {
    std::string body(size, '\0');
    for (std::size_t i = 0; i < size; ++i) {
        body[i] = static_cast<char>((i * 7 + i / 1000) % 251);
    }
    return body;
}

std::string readAll(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace

class ResumeTest : public ::testing::Test {
protected:
    fs::path root;
    std::string body;
    std::shared_ptr<FakeTransport> transport;
    std::unique_ptr<TransferManager> manager;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        root = fs::temp_directory_path() / (std::string("transferkit_resume_") + info->name());
        fs::remove_all(root);
        transport = std::make_shared<FakeTransport>(root / "spool");
        manager = std::make_unique<TransferManager>(transport, root / "downloads");

        body = patternBody(1000000);
        FakeTransport::Resource resource;
        resource.body = body;
        resource.chunk_size = 100000;
        transport->serve(kUrl, resource);
    }

    void TearDown() override {
        manager.reset();
        fs::remove_all(root);
    }

    // Starts the download and pauses it after three chunks; the token lands in `token`.
    TransferStream startAndPause() {
        transport->limitChunks(3);
        auto stream = manager->startDownload(kUrl);
        if (transport->waitForChunks(3)) {
            token = manager->pauseDownload();
        }
        return stream;
    }

    std::optional<ResumeToken> token;
};

TEST_F(ResumeTest, ResumedDownloadMatchesUninterruptedOne) {
    auto stream = startAndPause();
    ASSERT_TRUE(token.has_value());
    EXPECT_EQ(token->url(), kUrl);
    EXPECT_EQ(token->sessionId(), manager->sessionId());
    EXPECT_EQ(token->taskId(), stream.taskId());

    const auto continuation = token->continuation();
    ASSERT_TRUE(continuation.has_value());
    EXPECT_EQ(continuation->bytes_received, 300000u);

    const auto paused = manager->activeTask(TransferKind::Download);
    ASSERT_TRUE(paused.has_value());
    EXPECT_EQ(paused->state, TransferState::Paused);
    EXPECT_FALSE(stream.finished());

    transport->releaseChunks();
    const auto resumed = manager->resumeDownload(*token);
    EXPECT_EQ(resumed.taskId(), stream.taskId());

    const auto result = resumed.wait();
    ASSERT_TRUE(result.ok()) << result.error->message();
    EXPECT_EQ(readAll(*result.file()), body);
    EXPECT_TRUE(stream.wait().ok());

    // The original handle sees one uninterrupted, non-decreasing sequence.
    double last = 0.0;
    std::size_t terminals = 0;
    while (auto event = stream.next()) {
        if (const auto* progress = std::get_if<ProgressEvent>(&*event)) {
            EXPECT_GE(progress->fraction, last);
            last = progress->fraction;
        } else {
            ++terminals;
        }
    }
    EXPECT_DOUBLE_EQ(last, 1.0);
    EXPECT_EQ(terminals, 1u);

    const auto resumes = transport->resumes();
    ASSERT_EQ(resumes.size(), 2u);
    EXPECT_FALSE(resumes[0].has_value());
    ASSERT_TRUE(resumes[1].has_value());
    EXPECT_EQ(resumes[1]->bytes_received, 300000u);
}

TEST_F(ResumeTest, TokenWorksOnlyOnce) {
    auto stream = startAndPause();
    ASSERT_TRUE(token.has_value());

    transport->releaseChunks();
    const auto first = manager->resumeDownload(*token);
    const auto second = manager->resumeDownload(*token);

    const auto rejected = second.wait();
    ASSERT_TRUE(rejected.error.has_value());
    EXPECT_EQ(rejected.error->kind, ErrorKind::InvalidResumeToken);
    EXPECT_NE(second.taskId(), first.taskId());

    EXPECT_TRUE(first.wait().ok());
    EXPECT_TRUE(token->consumed());

    const auto late = manager->resumeDownload(*token).wait();
    ASSERT_TRUE(late.error.has_value());
    EXPECT_EQ(late.error->kind, ErrorKind::InvalidResumeToken);
}

TEST_F(ResumeTest, StartingSameUrlResumesPausedDownload) {
    auto stream = startAndPause();
    ASSERT_TRUE(token.has_value());

    transport->releaseChunks();
    const auto again = manager->startDownload(kUrl);
    EXPECT_EQ(again.taskId(), stream.taskId());
    const auto result = again.wait();
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(readAll(*result.file()), body);
    EXPECT_TRUE(token->consumed());

    const auto resumes = transport->resumes();
    ASSERT_EQ(resumes.size(), 2u);
    ASSERT_TRUE(resumes[1].has_value());
    EXPECT_EQ(resumes[1]->bytes_received, 300000u);
}

TEST_F(ResumeTest, StartingOtherUrlDiscardsPausedDownload) {
    auto stream = startAndPause();
    ASSERT_TRUE(token.has_value());
    const auto partial = token->continuation()->partial_file;
    ASSERT_TRUE(fs::exists(partial));

    FakeTransport::Resource other;
    other.body = "other";
    transport->serve("https://example.com/other.txt", other);
    transport->releaseChunks();

    const auto next = manager->startDownload("https://example.com/other.txt");
    EXPECT_NE(next.taskId(), stream.taskId());

    const auto replaced = stream.wait();
    ASSERT_TRUE(replaced.error.has_value());
    EXPECT_EQ(replaced.error->kind, ErrorKind::Cancelled);
    EXPECT_TRUE(token->consumed());
    EXPECT_FALSE(fs::exists(partial));
    EXPECT_EQ(transport->discarded(), 1u);

    EXPECT_TRUE(next.wait().ok());
}

TEST_F(ResumeTest, PauseBeforeAnyBytesCancels) {
    transport->limitChunks(0);
    const auto stream = manager->startDownload(kUrl);
    ASSERT_TRUE(transport->waitForCalls(1));

    EXPECT_FALSE(manager->pauseDownload().has_value());
    const auto result = stream.wait();
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, ErrorKind::Cancelled);
    EXPECT_FALSE(manager->activeTask(TransferKind::Download).has_value());
}

TEST_F(ResumeTest, CancelWhilePausedDiscardsPartialData) {
    auto stream = startAndPause();
    ASSERT_TRUE(token.has_value());
    const auto partial = token->continuation()->partial_file;

    manager->cancelDownload();

    const auto result = stream.wait();
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, ErrorKind::Cancelled);
    EXPECT_FALSE(fs::exists(partial));
    EXPECT_FALSE(manager->activeTask(TransferKind::Download).has_value());

    const auto resumed = manager->resumeDownload(*token).wait();
    ASSERT_TRUE(resumed.error.has_value());
    EXPECT_EQ(resumed.error->kind, ErrorKind::InvalidResumeToken);
}

TEST_F(ResumeTest, TokenFromAnotherManagerIsRejected) {
    auto stream = startAndPause();
    ASSERT_TRUE(token.has_value());

    TransferManager stranger(transport, root / "elsewhere");
    EXPECT_NE(stranger.sessionId(), manager->sessionId());
    const auto foreign = stranger.resumeDownload(*token).wait();
    ASSERT_TRUE(foreign.error.has_value());
    EXPECT_EQ(foreign.error->kind, ErrorKind::InvalidResumeToken);

    // The rightful owner can still use it.
    EXPECT_FALSE(token->consumed());
    transport->releaseChunks();
    EXPECT_TRUE(manager->resumeDownload(*token).wait().ok());
}

TEST_F(ResumeTest, UnreadableTokenIsRejected) {
    auto stream = startAndPause();
    ASSERT_TRUE(token.has_value());

    const ResumeToken forged(manager->sessionId(), token->taskId(), kUrl, "{not json");
    const auto result = manager->resumeDownload(forged).wait();
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, ErrorKind::InvalidResumeToken);

    manager->cancelDownload();
}

TEST_F(ResumeTest, TokenWithRewrittenContinuationIsRejected) {
    auto stream = startAndPause();
    ASSERT_TRUE(token.has_value());

    FakeTransport::Resource other;
    other.body = "BBBB";
    transport->serve("https://example.com/b.bin", other);

    // Right session and task, but pointing at another resource and file.
    Continuation rewritten;
    rewritten.url = "https://example.com/b.bin";
    rewritten.partial_file = root / "spool" / "b.part";
    const auto forged = ResumeToken::issue(manager->sessionId(), token->taskId(), rewritten);
    EXPECT_FALSE(forged.isSameAs(*token));

    const auto result = manager->resumeDownload(forged).wait();
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, ErrorKind::InvalidResumeToken);
    EXPECT_FALSE(fs::exists(root / "downloads" / "b.bin"));
    EXPECT_EQ(transport->resumes().size(), 1u);

    // The issued token is untouched and still resumes the original resource.
    EXPECT_FALSE(token->consumed());
    transport->releaseChunks();
    const auto resumed = manager->resumeDownload(*token).wait();
    ASSERT_TRUE(resumed.ok());
    EXPECT_EQ(readAll(*resumed.file()), body);
    EXPECT_TRUE(token->consumed());
}

TEST_F(ResumeTest, ListenerMayCancelWhenPausedDownloadIsReplaced) {
    auto stream = startAndPause();
    ASSERT_TRUE(token.has_value());

    std::atomic<int> terminals{0};
    stream.subscribe([&](const TransferEvent& event) {
        if (std::holds_alternative<TerminalEvent>(event)) {
            manager->cancelUpload();
            manager->cancelDownload();
            ++terminals;
        }
    });

    FakeTransport::Resource other;
    other.body = "other";
    transport->serve("https://example.com/other.txt", other);
    transport->releaseChunks();

    // Returns only if the replaced stream's listener could re-enter the manager.
    const auto next = manager->startDownload("https://example.com/other.txt");
    EXPECT_EQ(terminals.load(), 1);

    const auto replaced = stream.wait();
    ASSERT_TRUE(replaced.error.has_value());
    EXPECT_EQ(replaced.error->kind, ErrorKind::Cancelled);
    const auto result = next.wait();
    EXPECT_TRUE(result.ok() || result.error->kind == ErrorKind::Cancelled);
}

TEST(StopSignalTest, CancelOverridesPause) {
    StopSignal signal;
    EXPECT_FALSE(signal.requested());

    signal.request(StopReason::Pause);
    EXPECT_EQ(signal.reason(), StopReason::Pause);
    signal.request(StopReason::Cancel);
    EXPECT_EQ(signal.reason(), StopReason::Cancel);
    signal.request(StopReason::Pause);
    EXPECT_EQ(signal.reason(), StopReason::Cancel);
}

TEST(ResumeTokenTest, CopiesShareConsumption) {
    Continuation continuation;
    continuation.url = kUrl;
    continuation.partial_file = "/tmp/video.part";
    continuation.bytes_received = 512;
    continuation.total_bytes = 2048;
    continuation.validator = "\"abc\"";

    const auto token = ResumeToken::issue(4, 9, continuation);
    auto copy = token;

    const auto decoded = copy.continuation();
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->partial_file, fs::path("/tmp/video.part"));
    EXPECT_EQ(decoded->total_bytes, 2048u);
    EXPECT_EQ(decoded->validator, "\"abc\"");

    EXPECT_TRUE(copy.consume());
    EXPECT_TRUE(token.consumed());
    auto other = token;
    EXPECT_FALSE(other.consume());
}
