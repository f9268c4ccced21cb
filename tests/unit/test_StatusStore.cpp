#include <gtest/gtest.h>
#include "sync/StatusStore.hpp"

#include <vector>

using namespace sm::sync;
using namespace sm::sync::model;

class StatusStoreTest : public ::testing::Test {
protected:
    StatusStore store{3};
    std::vector<std::pair<State, State>> transitions;

    void SetUp() override {
        store.setTransitionListener([this](const State from, const State to, const std::string&) {
            transitions.emplace_back(from, to);
        });
    }
};

TEST_F(StatusStoreTest, StartsIdle) {
    const auto s = store.snapshot();
    EXPECT_EQ(s.state, State::Idle);
    EXPECT_EQ(s.message, "Idle");
    EXPECT_EQ(s.progress, 0);
    EXPECT_EQ(s.last_outcome, Outcome::None);
    EXPECT_TRUE(s.recent_transfers.empty());
}

TEST_F(StatusStoreTest, BeginRunResetsPerRunFields) {
    store.beginRun(JobKind::Sync, State::Connecting, "Connecting");
    store.setProgress(40);
    store.recordDownloaded(10);
    store.recordError();
    store.markFailed("boom", "Sync failed");
    store.finishRun(Outcome::Failed, "Sync failed", std::nullopt, std::nullopt);

    store.beginRun(JobKind::Sync, State::Connecting, "Connecting again");
    const auto s = store.snapshot();
    EXPECT_EQ(s.state, State::Connecting);
    EXPECT_EQ(s.active_kind, JobKind::Sync);
    EXPECT_EQ(s.progress, 0);
    EXPECT_EQ(s.stats, Stats{});
    EXPECT_FALSE(s.last_error.has_value());
    EXPECT_EQ(s.last_outcome, Outcome::Failed);
}

TEST_F(StatusStoreTest, ProgressIsClampedAndNeverDecreases) {
    store.beginRun(JobKind::Sync, State::Downloading, "Downloading");
    store.setProgress(30);
    store.setProgress(20);
    EXPECT_EQ(store.snapshot().progress, 30);

    store.setProgress(250);
    EXPECT_EQ(store.snapshot().progress, 100);

    store.setProgress(-5);
    EXPECT_EQ(store.snapshot().progress, 100);
}

TEST_F(StatusStoreTest, StopIsRefusedWhenIdleOrAlreadyStopping) {
    EXPECT_FALSE(store.requestStop("Stopping..."));

    store.beginRun(JobKind::Sync, State::Downloading, "Downloading");
    EXPECT_TRUE(store.requestStop("Stopping..."));
    EXPECT_FALSE(store.requestStop("Stopping..."));
    EXPECT_EQ(store.snapshot().state, State::Stopping);
}

TEST_F(StatusStoreTest, EngineCannotLeaveStoppingState) {
    store.beginRun(JobKind::Sync, State::Scanning, "Scanning");
    ASSERT_TRUE(store.requestStop("Stopping..."));

    store.setState(State::Downloading, "Downloading 3 file(s)");
    store.setMessage("Downloading a.txt (1/3)");

    const auto s = store.snapshot();
    EXPECT_EQ(s.state, State::Stopping);
    EXPECT_EQ(s.message, "Stopping...");
}

TEST_F(StatusStoreTest, EngineCannotWakeAnIdleStore) {
    store.setState(State::Downloading, "late update");
    EXPECT_EQ(store.snapshot().state, State::Idle);
}

TEST_F(StatusStoreTest, FinishRunSweepsInProgressTransfers) {
    store.beginRun(JobKind::Sync, State::Downloading, "Downloading");
    const auto done = store.beginTransfer("a.mkv", 10, "/data/a.mkv");
    store.finalizeTransfer(done, true);
    store.beginTransfer("b.mkv", 20, "/data/b.mkv");
    store.setActive("b.mkv", "/data/b.mkv");
    store.setSpeed("1.00 MB/s");

    const auto s = store.finishRun(Outcome::Cancelled, "Stopped by user", 1234, 5678);

    EXPECT_EQ(s.state, State::Idle);
    EXPECT_EQ(s.message, "Stopped by user");
    EXPECT_EQ(s.progress, 0);
    EXPECT_EQ(s.active_kind, JobKind::None);
    EXPECT_EQ(s.last_outcome, Outcome::Cancelled);
    EXPECT_FALSE(s.active_file.has_value());
    EXPECT_FALSE(s.target_path.has_value());
    EXPECT_FALSE(s.download_speed.has_value());
    EXPECT_EQ(s.last_sync_time, 1234);
    EXPECT_EQ(s.next_sync_time, 5678);

    ASSERT_EQ(s.recent_transfers.size(), 2u);
    EXPECT_EQ(s.recent_transfers[0].filename, "b.mkv");
    EXPECT_EQ(s.recent_transfers[0].status, FileTransfer::Status::Failure);
    EXPECT_EQ(s.recent_transfers[0].error_message, "Interrupted");
    EXPECT_TRUE(s.recent_transfers[0].completed_at.has_value());
    EXPECT_EQ(s.recent_transfers[1].status, FileTransfer::Status::Success);
}

TEST_F(StatusStoreTest, FinishRunKeepsLastSyncWhenNotGiven) {
    store.setLastSyncTime(42);
    store.beginRun(JobKind::Jellyfin, State::Jellyfin, "Starting Jellyfin tasks...");
    const auto s = store.finishRun(Outcome::Success, "Idle", std::nullopt, std::nullopt);
    EXPECT_EQ(s.last_sync_time, 42);
    EXPECT_FALSE(s.next_sync_time.has_value());
}

TEST_F(StatusStoreTest, RecentTransfersAreNewestFirstAndCapped) {
    store.beginRun(JobKind::Sync, State::Downloading, "Downloading");
    for (int i = 0; i < 5; ++i) {
        const auto id = store.beginTransfer("f" + std::to_string(i), 1, "/data/f");
        store.finalizeTransfer(id, true);
    }

    const auto s = store.snapshot();
    ASSERT_EQ(s.recent_transfers.size(), 3u);
    EXPECT_EQ(s.recent_transfers[0].filename, "f4");
    EXPECT_EQ(s.recent_transfers[2].filename, "f2");
}

TEST_F(StatusStoreTest, TransferIsFinalizedOnlyOnce) {
    store.beginRun(JobKind::Sync, State::Downloading, "Downloading");
    const auto id = store.beginTransfer("a", 1, "/data/a");
    store.finalizeTransfer(id, false, "Read error");
    store.finalizeTransfer(id, true);

    const auto t = store.snapshot().recent_transfers.front();
    EXPECT_EQ(t.status, FileTransfer::Status::Failure);
    EXPECT_EQ(t.error_message, "Read error");
}

TEST_F(StatusStoreTest, StatsAccumulate) {
    store.beginRun(JobKind::Sync, State::Downloading, "Downloading");
    store.recordDownloaded(100);
    store.recordDownloaded(50);
    store.recordError();

    const auto stats = store.snapshot().stats;
    EXPECT_EQ(stats.files_downloaded, 2u);
    EXPECT_EQ(stats.bytes_downloaded, 150u);
    EXPECT_EQ(stats.errors, 1u);
}

TEST_F(StatusStoreTest, ListenerSeesOnlyRealTransitions) {
    store.beginRun(JobKind::Sync, State::Connecting, "Connecting");
    store.setState(State::Connecting, "Connecting to host:22");
    store.setState(State::Scanning, "Scanning");
    store.requestStop("Stopping...");
    store.finishRun(Outcome::Cancelled, "Stopped by user", std::nullopt, std::nullopt);

    const std::vector<std::pair<State, State>> expected{
        {State::Idle, State::Connecting},
        {State::Connecting, State::Scanning},
        {State::Scanning, State::Stopping},
        {State::Stopping, State::Idle}
    };
    EXPECT_EQ(transitions, expected);
}
