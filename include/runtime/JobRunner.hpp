#pragma once

#include "sync/StatusStore.hpp"
#include "sync/Transfer.hpp"
#include "jellyfin/Orchestrator.hpp"
#include "jellyfin/MediaServerClient.hpp"
#include "remote/FileSystem.hpp"
#include "concurrency/ThreadWorker.hpp"

#include <chrono>
#include <condition_variable>
#include <ctime>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sm::config { class Provider; }
namespace sm::concurrency { class CancelToken; }
namespace sm::log { class ActivityLogger; class ErrorLogger; }

namespace sm::runtime {

struct RunReport {
    sync::model::JobKind kind{sync::model::JobKind::None};
    sync::model::Outcome outcome{sync::model::Outcome::None};
    sync::model::Stats stats;
    std::time_t finished_at{0};
    std::optional<std::string> error;
};

struct RunnerOptions {
    sync::TransferOptions transfer;
    jellyfin::OrchestratorOptions jellyfin;
    size_t recent_transfers_limit = 200;
};

// Owns the run status and the single worker. start() is the only way onto the
// worker and refuses while another run is active.
class JobRunner {
public:
    using Listener = std::function<void(const RunReport&)>;
    using NextRunSource = std::function<std::optional<std::time_t>()>;

    JobRunner(config::Provider& provider,
              remote::FileSystemFactory fsFactory,
              jellyfin::MediaServerClientFactory clientFactory,
              log::ActivityLogger& activity,
              log::ErrorLogger& errors,
              RunnerOptions opts = {});

    ~JobRunner();

    JobRunner(const JobRunner&) = delete;
    JobRunner& operator=(const JobRunner&) = delete;

    // Throws Conflict when not idle, InvalidConfig when the job cannot run.
    sync::model::SyncStatus start(sync::model::JobKind kind);
    sync::model::SyncStatus stop();
    [[nodiscard]] sync::model::SyncStatus status() const;

    void setNextSyncTime(std::optional<std::time_t> t);
    void setLastSyncTime(std::optional<std::time_t> t);

    // Consulted when a run finishes to refresh next_sync_time.
    void setNextRunSource(NextRunSource source);

    // Called on the worker thread after every run, once the status is idle again.
    void addListener(Listener listener);

    // Waits until every started run has finished and its listeners returned.
    bool waitUntilIdle(std::chrono::milliseconds timeout) const;

    void shutdown();

private:
    friend struct Job;
    friend struct SyncJob;
    friend struct JellyfinJob;

    config::Provider& provider_;
    remote::FileSystemFactory fsFactory_;
    jellyfin::MediaServerClientFactory clientFactory_;
    log::ActivityLogger& activity_;
    log::ErrorLogger& errors_;
    RunnerOptions opts_;

    sync::StatusStore store_;

    mutable std::mutex mutex_;
    mutable std::condition_variable idleCv_;
    std::shared_ptr<concurrency::CancelToken> cancel_;
    size_t pending_{0};
    bool shutdown_{false};
    NextRunSource nextRunSource_;
    std::vector<Listener> listeners_;

    // Last member: joined before anything it touches is destroyed.
    concurrency::ThreadWorker worker_;

    void finishJob(sync::model::JobKind kind, sync::model::Outcome outcome, const std::optional<std::string>& error);
};

}
