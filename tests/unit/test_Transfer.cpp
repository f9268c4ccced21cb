#include <gtest/gtest.h>
#include "fakes.hpp"
#include "sync/Transfer.hpp"
#include "sync/StatusStore.hpp"
#include "concurrency/CancelToken.hpp"

#include <fstream>
#include <sstream>

using namespace sm;
using namespace sm::sync;
using namespace sm::sync::model;
using namespace sm::test;

namespace {

std::string readFile(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// Forwards to a StatusStore and keeps every raw progress value.
class ProgressRecorder final : public ProgressSink {
public:
    explicit ProgressRecorder(StatusStore& store) : store_(store) {}

    std::vector<int> values;

    void setState(const State state, const std::string& message) override { store_.setState(state, message); }
    void setMessage(const std::string& message) override { store_.setMessage(message); }
    void setProgress(const int progress) override {
        values.push_back(progress);
        store_.setProgress(progress);
    }
    void setActive(std::optional<std::string> a, std::optional<std::string> t) override { store_.setActive(a, t); }
    void setSpeed(std::optional<std::string> speed) override { store_.setSpeed(speed); }
    uint64_t beginTransfer(const std::string& f, const uint64_t size, const std::string& t) override {
        return store_.beginTransfer(f, size, t);
    }
    void finalizeTransfer(const uint64_t id, const bool ok, std::optional<std::string> err) override {
        store_.finalizeTransfer(id, ok, err);
    }
    void recordDownloaded(const uint64_t bytes) override { store_.recordDownloaded(bytes); }
    void recordError() override { store_.recordError(); }

private:
    StatusStore& store_;
};

}

class TransferTest : public ::testing::Test {
protected:
    TempDir local{"transfer"};
    FakeFileSystem remote;
    StatusStore store;
    RecordingActivity activity;
    RecordingErrors errors;
    concurrency::CancelToken cancel;
    SftpConfig cfg;
    TransferOptions opts;

    void SetUp() override {
        cfg = makeSftpConfig(local.path() / "mirror");
        remote.addDir("/remote");
        opts.initial_backoff = std::chrono::milliseconds(1);
        opts.chunk_size = 3;
        store.beginRun(JobKind::Sync, State::Connecting, "Connecting");
    }

    Transfer makeTransfer(ProgressSink& sink) { return {cfg, remote, sink, activity, errors, cancel, opts}; }

    Outcome run() {
        auto transfer = makeTransfer(store);
        return transfer.run();
    }

    std::vector<std::string> plannedPaths() {
        auto transfer = makeTransfer(store);
        std::vector<std::string> out;
        for (const auto& f : transfer.scan()) out.push_back(f.relative_path);
        return out;
    }

    [[nodiscard]] fs::path mirror() const { return local.path() / "mirror"; }
};

TEST_F(TransferTest, ScanIsDepthFirstAndNameOrdered) {
    remote.addFile("/remote/b.txt", "bbb");
    remote.addFile("/remote/a/z.txt", "zz");
    remote.addFile("/remote/a/y.txt", "yy");
    remote.addFile("/remote/c.txt", "c");

    const std::vector<std::string> expected{"a/y.txt", "a/z.txt", "b.txt", "c.txt"};
    EXPECT_EQ(plannedPaths(), expected);
}

TEST_F(TransferTest, ScanHonoursSkipFoldersAtAnyDepth) {
    cfg.skip_folders = {"Private", "@eaDir"};
    remote.addFile("/remote/Private/secret.mkv", "s");
    remote.addFile("/remote/Movies/@eaDir/thumb.jpg", "t");
    remote.addFile("/remote/Movies/film.mkv", "f");

    const std::vector<std::string> expected{"Movies/film.mkv"};
    EXPECT_EQ(plannedPaths(), expected);
}

TEST_F(TransferTest, ScanSkipsFilesOlderThanStartAfter) {
    cfg.start_after = 5000;
    remote.addFile("/remote/old.txt", "old", 4999);
    remote.addFile("/remote/edge.txt", "edge", 5000);
    remote.addFile("/remote/new.txt", "new", 9000);

    const std::vector<std::string> expected{"edge.txt", "new.txt"};
    EXPECT_EQ(plannedPaths(), expected);
}

TEST_F(TransferTest, ScanSkipsFilesAlreadyPresentWithSameSize) {
    remote.addFile("/remote/same.txt", "12345");
    remote.addFile("/remote/changed.txt", "12345");

    fs::create_directories(mirror());
    std::ofstream(mirror() / "same.txt") << "abcde";
    std::ofstream(mirror() / "changed.txt") << "abc";

    const std::vector<std::string> expected{"changed.txt"};
    EXPECT_EQ(plannedPaths(), expected);
}

TEST_F(TransferTest, DownloadsEverythingIntoLocalRoot) {
    remote.addFile("/remote/a.txt", "alpha");
    remote.addFile("/remote/shows/s01/e01.mkv", "episode one");

    EXPECT_EQ(run(), Outcome::Success);

    EXPECT_EQ(readFile(mirror() / "a.txt"), "alpha");
    EXPECT_EQ(readFile(mirror() / "shows/s01/e01.mkv"), "episode one");
    EXPECT_FALSE(fs::exists(mirror() / "a.txt.partial"));

    const auto s = store.snapshot();
    EXPECT_EQ(s.stats.files_downloaded, 2u);
    EXPECT_EQ(s.stats.bytes_downloaded, 16u);
    EXPECT_EQ(s.stats.errors, 0u);
    EXPECT_EQ(s.progress, 100);
    EXPECT_EQ(s.state, State::Downloading);
    EXPECT_FALSE(s.active_file.has_value());
    EXPECT_FALSE(s.download_speed.has_value());
    EXPECT_EQ(remote.connects.load(), 1);
    EXPECT_EQ(remote.disconnects.load(), 1);
    EXPECT_EQ(activity.count("transfer.recorded"), 2u);
}

TEST_F(TransferTest, EmptyPlanCompletesAtFullProgress) {
    EXPECT_EQ(run(), Outcome::Success);
    EXPECT_EQ(store.snapshot().progress, 100);
    EXPECT_EQ(store.snapshot().stats, Stats{});
}

TEST_F(TransferTest, PermanentFailureIsCountedAndRunContinues) {
    remote.addFile("/remote/a.txt", "aaa");
    remote.addFile("/remote/b.txt", "bbb");
    remote.addFile("/remote/c.txt", "ccc");
    remote.failPermanently("/remote/b.txt");

    EXPECT_EQ(run(), Outcome::Success);

    const auto s = store.snapshot();
    EXPECT_EQ(s.stats.files_downloaded, 2u);
    EXPECT_EQ(s.stats.errors, 1u);
    EXPECT_TRUE(fs::exists(mirror() / "a.txt"));
    EXPECT_FALSE(fs::exists(mirror() / "b.txt"));
    EXPECT_TRUE(fs::exists(mirror() / "c.txt"));

    ASSERT_EQ(s.recent_transfers.size(), 3u);
    const auto& failed = s.recent_transfers[1];
    EXPECT_EQ(failed.filename, "b.txt");
    EXPECT_EQ(failed.status, FileTransfer::Status::Failure);
    ASSERT_TRUE(failed.error_message.has_value());
    EXPECT_NE(failed.error_message->find("Read error"), std::string::npos);

    const auto logged = errors.messages();
    ASSERT_EQ(logged.size(), 1u);
    EXPECT_EQ(logged[0].rfind("/remote/b.txt - ", 0), 0u);
}

TEST_F(TransferTest, FailedFileIsAttemptedMaxAttemptsTimes) {
    opts.max_attempts = 3;
    remote.addFile("/remote/bad.txt", "x");
    remote.failPermanently("/remote/bad.txt");

    EXPECT_EQ(run(), Outcome::Success);
    EXPECT_EQ(remote.openReads.load(), 3);
}

TEST_F(TransferTest, TransientFailureIsRetried) {
    remote.addFile("/remote/flaky.txt", "eventually");
    remote.failTransiently("/remote/flaky.txt", 2);

    EXPECT_EQ(run(), Outcome::Success);

    const auto s = store.snapshot();
    EXPECT_EQ(s.stats.files_downloaded, 1u);
    EXPECT_EQ(s.stats.errors, 0u);
    EXPECT_EQ(readFile(mirror() / "flaky.txt"), "eventually");
    EXPECT_TRUE(errors.messages().empty());
}

TEST_F(TransferTest, NestedListingFailureSkipsSubtreeOnly) {
    remote.addFile("/remote/locked/x.txt", "x");
    remote.addFile("/remote/open/y.txt", "y");
    remote.failListing("/remote/locked");

    EXPECT_EQ(run(), Outcome::Success);

    EXPECT_TRUE(fs::exists(mirror() / "open/y.txt"));
    EXPECT_FALSE(fs::exists(mirror() / "locked/x.txt"));
    EXPECT_EQ(store.snapshot().stats.errors, 0u);
    ASSERT_EQ(errors.messages().size(), 1u);
    EXPECT_NE(errors.messages()[0].find("/remote/locked"), std::string::npos);
}

TEST_F(TransferTest, RootListingFailureIsConnectionFailure) {
    remote.failListing("/remote");
    EXPECT_THROW(run(), runtime::ConnectionFailure);
    EXPECT_EQ(remote.disconnects.load(), 1);
}

TEST_F(TransferTest, ConnectFailurePropagates) {
    remote.failConnect = true;
    remote.addFile("/remote/a.txt", "a");
    EXPECT_THROW(run(), runtime::ConnectionFailure);
    EXPECT_FALSE(fs::exists(mirror() / "a.txt"));
}

TEST_F(TransferTest, CancelMidFileStopsRunAndCleansPartial) {
    remote.addFile("/remote/a.txt", "first file");
    remote.addFile("/remote/b.txt", "second file, long enough for several chunks");
    remote.addFile("/remote/c.txt", "third");
    remote.onRead([this](const std::string& path) {
        if (path == "/remote/b.txt") cancel.cancel();
    });

    EXPECT_EQ(run(), Outcome::Cancelled);

    EXPECT_TRUE(fs::exists(mirror() / "a.txt"));
    EXPECT_FALSE(fs::exists(mirror() / "b.txt"));
    EXPECT_FALSE(fs::exists(mirror() / "b.txt.partial"));
    EXPECT_FALSE(fs::exists(mirror() / "c.txt"));

    const auto s = store.snapshot();
    EXPECT_EQ(s.stats.files_downloaded, 1u);
    ASSERT_EQ(s.recent_transfers.size(), 2u);
    EXPECT_EQ(s.recent_transfers[0].filename, "b.txt");
    EXPECT_EQ(s.recent_transfers[0].status, FileTransfer::Status::Failure);
    EXPECT_EQ(s.recent_transfers[0].error_message, "Cancelled by user");
}

TEST_F(TransferTest, CancelBeforeStartDoesNotConnect) {
    cancel.cancel();
    EXPECT_EQ(run(), Outcome::Cancelled);
    EXPECT_EQ(remote.connects.load(), 0);
}

TEST_F(TransferTest, ProgressNeverDecreasesAcrossFiles) {
    remote.addFile("/remote/1.bin", std::string(10, 'a'));
    remote.addFile("/remote/2.bin", std::string(25, 'b'));
    remote.addFile("/remote/3.bin", std::string(7, 'c'));

    ProgressRecorder recorder(store);
    auto transfer = makeTransfer(recorder);
    ASSERT_EQ(transfer.run(), Outcome::Success);

    ASSERT_FALSE(recorder.values.empty());
    for (size_t i = 1; i < recorder.values.size(); ++i)
        EXPECT_GE(recorder.values[i], recorder.values[i - 1]) << "at sample " << i;
    EXPECT_EQ(recorder.values.back(), 100);
}

TEST_F(TransferTest, StateWalksConnectingScanningDownloading) {
    std::vector<State> seen;
    store.setTransitionListener([&seen](State, const State to, const std::string&) { seen.push_back(to); });
    remote.addFile("/remote/a.txt", "a");

    ASSERT_EQ(run(), Outcome::Success);

    const std::vector<State> expected{State::Scanning, State::Downloading};
    EXPECT_EQ(seen, expected);
}
