#include <gtest/gtest.h>
#include "fakes.hpp"
#include "runtime/hooks.hpp"
#include "log/Registry.hpp"

#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/ostream_sink.h>

using namespace sm;
using namespace sm::runtime;
using namespace sm::sync::model;
using namespace sm::test;
using namespace std::chrono_literals;

namespace {

RunReport successfulSync(const uint64_t files) {
    RunReport r;
    r.kind = JobKind::Sync;
    r.outcome = Outcome::Success;
    r.stats.files_downloaded = files;
    r.finished_at = 1'700'000'000;
    return r;
}

jellyfin::model::Config testedJellyfin() {
    jellyfin::model::Config cfg;
    cfg.server_url = "http://jellyfin.local:8096";
    cfg.api_key = "secret";
    cfg.tested = true;
    cfg.selected_tasks = {makeSelectedTask("RefreshLibrary", "Scan Media Library", 0)};
    return cfg;
}

}

TEST(ChainJellyfinTest, ChainsAfterSyncThatDownloadedFiles) {
    EXPECT_TRUE(shouldChainJellyfin(successfulSync(3), testedJellyfin()));
}

TEST(ChainJellyfinTest, NothingDownloadedMeansNoChain) {
    EXPECT_FALSE(shouldChainJellyfin(successfulSync(0), testedJellyfin()));
}

TEST(ChainJellyfinTest, OnlySuccessfulSyncsChain) {
    auto cancelled = successfulSync(2);
    cancelled.outcome = Outcome::Cancelled;
    EXPECT_FALSE(shouldChainJellyfin(cancelled, testedJellyfin()));

    auto failed = successfulSync(2);
    failed.outcome = Outcome::Failed;
    EXPECT_FALSE(shouldChainJellyfin(failed, testedJellyfin()));

    auto jellyfinRun = successfulSync(2);
    jellyfinRun.kind = JobKind::Jellyfin;
    EXPECT_FALSE(shouldChainJellyfin(jellyfinRun, testedJellyfin()));
}

TEST(ChainJellyfinTest, RequiresTestedConfigWithEnabledTask) {
    EXPECT_FALSE(shouldChainJellyfin(successfulSync(1), std::nullopt));

    auto untested = testedJellyfin();
    untested.tested = false;
    EXPECT_FALSE(shouldChainJellyfin(successfulSync(1), untested));

    auto allDisabled = testedJellyfin();
    allDisabled.selected_tasks[0].enabled = false;
    EXPECT_FALSE(shouldChainJellyfin(successfulSync(1), allDisabled));
}

class LastSyncFileTest : public ::testing::Test {
protected:
    TempDir dir{"last_sync"};
    [[nodiscard]] fs::path file() const { return dir.path() / "state" / "last_sync"; }
};

TEST_F(LastSyncFileTest, MissingFileMeansNeverSynced) {
    EXPECT_FALSE(loadLastSync(file()).has_value());
}

TEST_F(LastSyncFileTest, SaveThenLoad) {
    saveLastSync(file(), 1'712'345'678);
    EXPECT_EQ(loadLastSync(file()), 1'712'345'678);
    EXPECT_FALSE(fs::exists(file().string() + ".tmp"));
}

TEST_F(LastSyncFileTest, GarbageIsIgnored) {
    fs::create_directories(file().parent_path());
    std::ofstream(file()) << "not a timestamp";
    EXPECT_FALSE(loadLastSync(file()).has_value());
}

class RunHooksTest : public ::testing::Test {
protected:
    TempDir dir{"hooks"};
    FakeFileSystem remote;
    FakeMediaServerClient mediaServer;
    InMemoryProvider provider;
    RecordingActivity activity;
    RecordingErrors errors;
    std::unique_ptr<JobRunner> runner;

    void SetUp() override {
        remote.addDir("/remote");
        mediaServer.tasks = {makeServerTask("id-scan", "RefreshLibrary", "Scan Media Library")};

        RunnerOptions opts;
        opts.jellyfin.poll_interval = 1ms;
        runner = std::make_unique<JobRunner>(
            provider,
            [this] { return std::make_unique<FileSystemProxy>(remote); },
            [this](const jellyfin::model::Config&) { return std::make_unique<MediaServerClientProxy>(mediaServer); },
            activity, errors, opts);

        provider.setSftp(makeSftpConfig(dir.path() / "mirror"));
        provider.setJellyfin(testedJellyfin());
    }

    void TearDown() override { runner.reset(); }
};

TEST_F(RunHooksTest, SyncWithDownloadsLaunchesJellyfinTasks) {
    chainJellyfinAfterSync(*runner, provider, activity);
    remote.addFile("/remote/new-episode.mkv", "frames");

    runner->start(JobKind::Sync);
    ASSERT_TRUE(runner->waitUntilIdle(5s));

    EXPECT_EQ(mediaServer.triggered(), std::vector<std::string>{"id-scan"});
    EXPECT_EQ(activity.count("jellyfin.run_completed"), 1u);
    EXPECT_EQ(runner->status().stats.files_downloaded, 0u); // reset by the Jellyfin run
    EXPECT_EQ(runner->status().last_outcome, Outcome::Success);
}

TEST_F(RunHooksTest, SyncWithoutDownloadsDoesNotLaunchJellyfin) {
    chainJellyfinAfterSync(*runner, provider, activity);

    runner->start(JobKind::Sync);
    ASSERT_TRUE(runner->waitUntilIdle(5s));

    EXPECT_TRUE(mediaServer.triggered().empty());
    EXPECT_EQ(mediaServer.listCalls.load(), 0);
}

TEST_F(RunHooksTest, FinishedRunLogsStatusSnapshot) {
    std::ostringstream out;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    sink->set_pattern("%v");
    const auto logger = sm::log::Registry::syncmon();
    const auto previousLevel = logger->level();
    logger->sinks().push_back(sink);
    logger->set_level(spdlog::level::info);

    logStatusOnFinish(*runner);
    remote.addFile("/remote/new-episode.mkv", "frames");
    runner->start(JobKind::Sync);
    const bool idle = runner->waitUntilIdle(5s);

    logger->sinks().pop_back();
    logger->set_level(previousLevel);
    ASSERT_TRUE(idle);

    const auto line = out.str();
    const auto start = line.find("[Status] ");
    ASSERT_NE(start, std::string::npos);
    const auto end = line.find('\n', start);
    const auto j = nlohmann::json::parse(line.substr(start + 9, end - start - 9));
    EXPECT_EQ(j["state"], "idle");
    EXPECT_EQ(j["last_outcome"], "success");
    EXPECT_EQ(j["stats"]["files_downloaded"], 1);
}

TEST_F(RunHooksTest, FinishedSyncIsPersisted) {
    const auto marker = dir.path() / "last_sync";
    persistLastSyncOnFinish(*runner, marker);

    runner->start(JobKind::Sync);
    ASSERT_TRUE(runner->waitUntilIdle(5s));

    const auto saved = loadLastSync(marker);
    ASSERT_TRUE(saved.has_value());
    EXPECT_EQ(saved, runner->status().last_sync_time);
}
