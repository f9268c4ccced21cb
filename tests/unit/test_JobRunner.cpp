#include <gtest/gtest.h>
#include "fakes.hpp"
#include "runtime/JobRunner.hpp"
#include "runtime/Scheduler.hpp"
#include "runtime/errors.hpp"

#include <algorithm>
#include <latch>
#include <thread>

using namespace sm;
using namespace sm::runtime;
using namespace sm::sync::model;
using namespace sm::test;
using namespace std::chrono_literals;

class JobRunnerTest : public ::testing::Test {
protected:
    TempDir local{"runner"};
    FakeFileSystem remote;
    FakeMediaServerClient mediaServer;
    InMemoryProvider provider;
    RecordingActivity activity;
    RecordingErrors errors;
    std::unique_ptr<JobRunner> runner;

    void SetUp() override {
        remote.addDir("/remote");

        RunnerOptions opts;
        opts.transfer.initial_backoff = 1ms;
        opts.jellyfin.poll_interval = 1ms;

        runner = std::make_unique<JobRunner>(
            provider,
            [this] { return std::make_unique<FileSystemProxy>(remote); },
            [this](const jellyfin::model::Config&) { return std::make_unique<MediaServerClientProxy>(mediaServer); },
            activity, errors, opts);
    }

    void TearDown() override { runner.reset(); }

    void configureSftp() { provider.setSftp(makeSftpConfig(local.path() / "mirror")); }

    void configureJellyfin(const bool tested = true) {
        jellyfin::model::Config cfg;
        cfg.server_url = "http://jellyfin.local:8096";
        cfg.api_key = "secret";
        cfg.tested = tested;
        cfg.selected_tasks = {makeSelectedTask("RefreshLibrary", "Scan Media Library", 0)};
        provider.setJellyfin(cfg);
        mediaServer.tasks = {makeServerTask("id-scan", "RefreshLibrary", "Scan Media Library")};
    }

    // Holds the worker inside the first chunk read of any file.
    std::shared_ptr<Gate> holdFirstRead() {
        auto gate = std::make_shared<Gate>();
        remote.onRead([gate](const std::string&) { gate->enter(); });
        return gate;
    }
};

TEST_F(JobRunnerTest, SyncWithoutConfigurationIsInvalid) {
    EXPECT_THROW(runner->start(JobKind::Sync), InvalidConfig);
    EXPECT_TRUE(runner->status().isIdle());
    EXPECT_EQ(runner->status().last_outcome, Outcome::None);
}

TEST_F(JobRunnerTest, IncompleteConfigurationNamesMissingFields) {
    auto cfg = makeSftpConfig(local.path());
    cfg.password.clear();
    cfg.remote_root.clear();
    provider.setSftp(cfg);

    try {
        runner->start(JobKind::Sync);
        FAIL() << "expected InvalidConfig";
    } catch (const InvalidConfig& e) {
        const std::string what = e.what();
        EXPECT_NE(what.find("password"), std::string::npos);
        EXPECT_NE(what.find("remote_root"), std::string::npos);
    }
    EXPECT_TRUE(runner->status().isIdle());
}

TEST_F(JobRunnerTest, SuccessfulSyncReturnsToIdle) {
    configureSftp();
    remote.addFile("/remote/a.mkv", "movie bytes");

    std::vector<RunReport> reports;
    std::mutex reportsMutex;
    runner->addListener([&](const RunReport& r) {
        std::scoped_lock lock(reportsMutex);
        reports.push_back(r);
    });

    const auto started = runner->start(JobKind::Sync);
    EXPECT_EQ(started.state, State::Connecting);
    EXPECT_EQ(started.message, "Connecting to files.example.org:2222");
    EXPECT_EQ(started.active_kind, JobKind::Sync);

    ASSERT_TRUE(runner->waitUntilIdle(5s));

    const auto s = runner->status();
    EXPECT_EQ(s.state, State::Idle);
    EXPECT_EQ(s.message, "Idle");
    EXPECT_EQ(s.last_outcome, Outcome::Success);
    EXPECT_EQ(s.stats.files_downloaded, 1u);
    EXPECT_TRUE(s.last_sync_time.has_value());
    EXPECT_FALSE(s.last_error.has_value());

    ASSERT_EQ(reports.size(), 1u);
    EXPECT_EQ(reports[0].kind, JobKind::Sync);
    EXPECT_EQ(reports[0].outcome, Outcome::Success);
    EXPECT_EQ(reports[0].stats.files_downloaded, 1u);

    EXPECT_EQ(activity.count("sync.start"), 1u);
    EXPECT_EQ(activity.count("sync.completed"), 1u);
    const std::vector<std::string> expected{"connecting", "scanning", "downloading", "idle"};
    EXPECT_EQ(activity.transitions(), expected);
}

TEST_F(JobRunnerTest, SecondStartIsAConflictAndChangesNothing) {
    configureSftp();
    remote.addFile("/remote/a.mkv", "movie bytes");
    const auto gate = holdFirstRead();

    runner->start(JobKind::Sync);
    ASSERT_TRUE(gate->waitEntered());

    const auto before = runner->status();
    EXPECT_THROW(runner->start(JobKind::Sync), Conflict);
    EXPECT_THROW(runner->start(JobKind::Jellyfin), Conflict);
    EXPECT_EQ(runner->status(), before);

    gate->release();
    ASSERT_TRUE(runner->waitUntilIdle(5s));
    EXPECT_EQ(runner->status().last_outcome, Outcome::Success);
}

TEST_F(JobRunnerTest, SimultaneousStartsLaunchExactlyOneRun) {
    auto cfg = makeSftpConfig(local.path() / "mirror");
    cfg.auto_sync_enabled = true;
    provider.setSftp(cfg);
    remote.addFile("/remote/a.mkv", "movie bytes");
    const auto gate = holdFirstRead();

    Scheduler scheduler(*runner, activity, [] { return std::time_t{1'700'000'000}; });
    scheduler.onConfigChanged(cfg); // never synced: due right away

    constexpr int callers = 8;
    std::latch ready(callers + 1);
    std::atomic<int> started{0}, conflicts{0}, others{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < callers; ++i) {
        threads.emplace_back([&] {
            ready.arrive_and_wait();
            try {
                runner->start(JobKind::Sync);
                ++started;
            } catch (const Conflict&) {
                ++conflicts;
            } catch (const std::exception&) {
                ++others;
            }
        });
    }
    threads.emplace_back([&] {
        ready.arrive_and_wait();
        scheduler.fireDue();
    });
    for (auto& t : threads) t.join();

    const auto triggered = static_cast<int>(activity.count("autosync.run_triggered"));
    const auto skipped = static_cast<int>(activity.count("autosync.run_skipped"));
    EXPECT_EQ(started.load() + triggered, 1);
    EXPECT_EQ(conflicts.load() + skipped, callers);
    EXPECT_EQ(others.load(), 0);

    ASSERT_TRUE(gate->waitEntered());
    gate->release();
    ASSERT_TRUE(runner->waitUntilIdle(5s));
    scheduler.stop();

    EXPECT_EQ(remote.connects.load(), 1);
    EXPECT_EQ(runner->status().stats.files_downloaded, 1u);
}

TEST_F(JobRunnerTest, StopPassesThroughStoppingToIdle) {
    configureSftp();
    remote.addFile("/remote/a.mkv", "first");
    remote.addFile("/remote/b.mkv", "second");
    const auto gate = holdFirstRead();

    runner->start(JobKind::Sync);
    ASSERT_TRUE(gate->waitEntered());

    const auto stopping = runner->stop();
    EXPECT_EQ(stopping.state, State::Stopping);
    EXPECT_EQ(stopping.message, "Stopping...");

    gate->release();
    ASSERT_TRUE(runner->waitUntilIdle(5s));

    const auto s = runner->status();
    EXPECT_EQ(s.state, State::Idle);
    EXPECT_EQ(s.message, "Stopped by user");
    EXPECT_EQ(s.last_outcome, Outcome::Cancelled);
    EXPECT_TRUE(std::ranges::none_of(s.recent_transfers, [](const FileTransfer& t) { return !t.finalized(); }));
    EXPECT_FALSE(std::filesystem::exists(local.path() / "mirror" / "b.mkv"));

    const auto transitions = activity.transitions();
    ASSERT_GE(transitions.size(), 2u);
    EXPECT_EQ(transitions[transitions.size() - 2], "stopping");
    EXPECT_EQ(transitions.back(), "idle");
    EXPECT_EQ(activity.count("sync.stopped"), 1u);
}

TEST_F(JobRunnerTest, StopWhenIdleIsANoOp) {
    const auto s = runner->stop();
    EXPECT_EQ(s.state, State::Idle);
    EXPECT_EQ(activity.count("sync.stop_requested"), 0u);
}

TEST_F(JobRunnerTest, FailedSyncRecordsErrorAndReturnsToIdle) {
    configureSftp();
    remote.failConnect = true;

    runner->start(JobKind::Sync);
    ASSERT_TRUE(runner->waitUntilIdle(5s));

    const auto s = runner->status();
    EXPECT_EQ(s.state, State::Idle);
    EXPECT_EQ(s.message, "Sync failed");
    EXPECT_EQ(s.last_outcome, Outcome::Failed);
    ASSERT_TRUE(s.last_error.has_value());
    EXPECT_NE(s.last_error->find("Connection refused"), std::string::npos);

    ASSERT_EQ(errors.messages().size(), 1u);
    EXPECT_EQ(activity.count("sync.failed"), 1u);

    const auto transitions = activity.transitions();
    ASSERT_GE(transitions.size(), 2u);
    EXPECT_EQ(transitions[transitions.size() - 2], "error");
    EXPECT_EQ(transitions.back(), "idle");
}

TEST_F(JobRunnerTest, RunnerAcceptsANewRunAfterFailure) {
    configureSftp();
    remote.failConnect = true;
    runner->start(JobKind::Sync);
    ASSERT_TRUE(runner->waitUntilIdle(5s));

    remote.failConnect = false;
    runner->start(JobKind::Sync);
    ASSERT_TRUE(runner->waitUntilIdle(5s));
    EXPECT_EQ(runner->status().last_outcome, Outcome::Success);
    EXPECT_FALSE(runner->status().last_error.has_value());
}

TEST_F(JobRunnerTest, JellyfinRequiresTestedConnection) {
    EXPECT_THROW(runner->start(JobKind::Jellyfin), InvalidConfig);

    configureJellyfin(false);
    EXPECT_THROW(runner->start(JobKind::Jellyfin), InvalidConfig);
    EXPECT_EQ(mediaServer.listCalls.load(), 0);
}

TEST_F(JobRunnerTest, JellyfinRunUsesSharedStatus) {
    configureJellyfin();

    const auto started = runner->start(JobKind::Jellyfin);
    EXPECT_EQ(started.state, State::Jellyfin);
    EXPECT_EQ(started.active_kind, JobKind::Jellyfin);

    ASSERT_TRUE(runner->waitUntilIdle(5s));
    const auto s = runner->status();
    EXPECT_EQ(s.state, State::Idle);
    EXPECT_EQ(s.last_outcome, Outcome::Success);
    EXPECT_FALSE(s.last_sync_time.has_value());
    EXPECT_EQ(mediaServer.triggered(), std::vector<std::string>{"id-scan"});
    EXPECT_EQ(activity.count("jellyfin.run_completed"), 1u);
}

TEST_F(JobRunnerTest, JellyfinFailureCarriesTaskName) {
    configureJellyfin();
    mediaServer.tasks.clear();

    runner->start(JobKind::Jellyfin);
    ASSERT_TRUE(runner->waitUntilIdle(5s));

    const auto s = runner->status();
    EXPECT_EQ(s.last_outcome, Outcome::Failed);
    EXPECT_EQ(s.message, "Jellyfin tasks failed");
    ASSERT_TRUE(s.last_error.has_value());
    EXPECT_NE(s.last_error->find("Scan Media Library"), std::string::npos);
}

TEST_F(JobRunnerTest, JellyfinRunWithNothingSelectedFails) {
    configureJellyfin();
    auto cfg = *provider.jellyfin();
    cfg.selected_tasks[0].enabled = false;
    provider.setJellyfin(cfg);

    runner->start(JobKind::Jellyfin);
    ASSERT_TRUE(runner->waitUntilIdle(5s));

    const auto s = runner->status();
    EXPECT_EQ(s.last_outcome, Outcome::Failed);
    EXPECT_EQ(s.last_error, "No Jellyfin tasks have been selected.");
    EXPECT_EQ(activity.count("jellyfin.run_failed"), 1u);
    EXPECT_EQ(errors.messages().size(), 1u);
    EXPECT_EQ(mediaServer.listCalls.load(), 0);
}

TEST_F(JobRunnerTest, NextSyncTimeComesFromNextRunSource) {
    configureSftp();
    runner->setNextRunSource([] { return std::optional<std::time_t>(1'900'000'000); });

    runner->start(JobKind::Sync);
    ASSERT_TRUE(runner->waitUntilIdle(5s));
    EXPECT_EQ(runner->status().next_sync_time, 1'900'000'000);
}

TEST_F(JobRunnerTest, ThrowingListenerDoesNotWedgeTheRunner) {
    configureSftp();
    runner->addListener([](const RunReport&) { throw std::runtime_error("listener exploded"); });

    runner->start(JobKind::Sync);
    ASSERT_TRUE(runner->waitUntilIdle(5s));
    EXPECT_TRUE(runner->status().isIdle());

    runner->start(JobKind::Sync);
    EXPECT_TRUE(runner->waitUntilIdle(5s));
}

TEST_F(JobRunnerTest, StartAfterShutdownIsRefused) {
    configureSftp();
    runner->shutdown();
    EXPECT_THROW(runner->start(JobKind::Sync), Conflict);
}
