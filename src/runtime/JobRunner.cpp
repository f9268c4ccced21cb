#include "runtime/JobRunner.hpp"
#include "runtime/Job.hpp"
#include "runtime/errors.hpp"
#include "concurrency/CancelToken.hpp"
#include "config/Provider.hpp"
#include "log/Registry.hpp"
#include "log/Sinks.hpp"
#include "util/timestamp.hpp"

#include <fmt/format.h>

using namespace sm::runtime;
using namespace sm::sync::model;
using namespace sm::log;
using namespace sm::concurrency;

namespace {

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) out += (out.empty() ? "" : ", ") + item;
    return out;
}

}

JobRunner::JobRunner(config::Provider& provider,
                     remote::FileSystemFactory fsFactory,
                     jellyfin::MediaServerClientFactory clientFactory,
                     ActivityLogger& activity,
                     ErrorLogger& errors,
                     RunnerOptions opts)
    : provider_(provider),
      fsFactory_(std::move(fsFactory)),
      clientFactory_(std::move(clientFactory)),
      activity_(activity),
      errors_(errors),
      opts_(std::move(opts)),
      store_(opts_.recent_transfers_limit),
      worker_("JobRunner") {
    store_.setTransitionListener([this](const State from, const State to, const std::string& message) {
        Registry::sync()->debug("[JobRunner] {} -> {} ({})", to_string(from), to_string(to), message);
        activity_.record({
            .action = "sync.state",
            .details = {{"from", to_string(from)}, {"to", to_string(to)}, {"message", message}}
        });
    });
}

JobRunner::~JobRunner() { shutdown(); }

SyncStatus JobRunner::start(const JobKind kind) {
    std::scoped_lock lock(mutex_);

    if (shutdown_) throw Conflict("Runner is shutting down");

    const auto current = store_.snapshot();
    if (!current.isIdle())
        throw Conflict(fmt::format("A {} run is already in progress ({})",
                                   to_string(current.active_kind), to_string(current.state)));

    auto cancel = std::make_shared<CancelToken>();
    std::shared_ptr<Job> job;

    if (kind == JobKind::Sync) {
        const auto cfg = provider_.sftp();
        if (!cfg) throw InvalidConfig("SFTP is not configured");
        if (const auto missing = cfg->missingFields(); !missing.empty())
            throw InvalidConfig("SFTP configuration is incomplete: missing " + join(missing));

        store_.beginRun(JobKind::Sync, State::Connecting, fmt::format("Connecting to {}:{}", cfg->host, cfg->port));
        activity_.record({
            .action = "sync.start",
            .details = {{"host", cfg->host}, {"port", cfg->port}, {"remote_root", cfg->remote_root},
                        {"local_root", cfg->local_root}}
        });
        job = std::make_shared<SyncJob>(*this, cancel, *cfg);
    } else if (kind == JobKind::Jellyfin) {
        const auto cfg = provider_.jellyfin();
        if (!cfg) throw InvalidConfig("Jellyfin is not configured");
        if (!cfg->tested) throw InvalidConfig("Jellyfin connection has not been tested");

        store_.beginRun(JobKind::Jellyfin, State::Jellyfin, "Starting Jellyfin tasks...");
        job = std::make_shared<JellyfinJob>(*this, cancel, *cfg);
    } else {
        throw InvalidConfig("Unknown job kind");
    }

    cancel_ = std::move(cancel);
    auto started = store_.snapshot();
    ++pending_;
    worker_.enqueue(job);

    Registry::sync()->info("[JobRunner] {} run started", to_string(kind));
    return started;
}

SyncStatus JobRunner::stop() {
    std::scoped_lock lock(mutex_);

    if (!store_.requestStop("Stopping...")) return store_.snapshot();

    if (cancel_) cancel_->cancel();
    activity_.record({.action = "sync.stop_requested"});
    Registry::sync()->info("[JobRunner] Stop requested");
    return store_.snapshot();
}

SyncStatus JobRunner::status() const {
    return store_.snapshot();
}

void JobRunner::setNextSyncTime(const std::optional<std::time_t> t) {
    store_.setNextSyncTime(t);
}

void JobRunner::setLastSyncTime(const std::optional<std::time_t> t) {
    store_.setLastSyncTime(t);
}

void JobRunner::setNextRunSource(NextRunSource source) {
    std::scoped_lock lock(mutex_);
    nextRunSource_ = std::move(source);
}

void JobRunner::addListener(Listener listener) {
    std::scoped_lock lock(mutex_);
    listeners_.push_back(std::move(listener));
}

void JobRunner::finishJob(const JobKind kind, const Outcome outcome, const std::optional<std::string>& error) {
    const bool isSync = kind == JobKind::Sync;
    const auto now = util::nowSeconds();

    NextRunSource nextSource;
    std::vector<Listener> listeners;
    {
        std::scoped_lock lock(mutex_);
        nextSource = nextRunSource_;
        listeners = listeners_;
    }

    const auto stats = store_.snapshot().stats;
    const auto next = nextSource ? nextSource() : store_.snapshot().next_sync_time;
    const auto lastSync = isSync ? std::optional<std::time_t>(now) : std::nullopt;

    std::string message;
    switch (outcome) {
        case Outcome::Success:
            message = "Idle";
            if (isSync) {
                activity_.record({
                    .action = "sync.completed",
                    .details = {{"files_downloaded", stats.files_downloaded},
                                {"bytes_downloaded", stats.bytes_downloaded},
                                {"errors", stats.errors}}
                });
            } else {
                activity_.record({.action = "jellyfin.run_completed"});
            }
            break;
        case Outcome::Cancelled:
            message = isSync ? "Stopped by user" : "Jellyfin tasks cancelled";
            activity_.record({.action = isSync ? "sync.stopped" : "jellyfin.run_cancelled"});
            break;
        default: {
            message = isSync ? "Sync failed" : "Jellyfin tasks failed";
            const auto what = error.value_or("Unknown error");
            store_.markFailed(what, message);
            errors_.record(what);
            activity_.record({
                .action = isSync ? "sync.failed" : "jellyfin.run_failed",
                .details = {{"error", what}},
                .level = Event::Level::Error
            });
            break;
        }
    }

    store_.finishRun(outcome == Outcome::None ? Outcome::Failed : outcome, message, lastSync, next);
    Registry::sync()->info("[JobRunner] {} run finished: {} ({} file(s), {} bytes, {} error(s))",
                           to_string(kind), to_string(outcome), stats.files_downloaded, stats.bytes_downloaded,
                           stats.errors);

    const RunReport report{
        .kind = kind,
        .outcome = outcome,
        .stats = stats,
        .finished_at = now,
        .error = error
    };

    for (const auto& listener : listeners) {
        try {
            listener(report);
        } catch (const std::exception& e) {
            Registry::sync()->error("[JobRunner] Run listener failed: {}", e.what());
        }
    }

    {
        std::scoped_lock lock(mutex_);
        if (pending_ > 0) --pending_;
    }
    idleCv_.notify_all();
}

bool JobRunner::waitUntilIdle(const std::chrono::milliseconds timeout) const {
    std::unique_lock lock(mutex_);
    return idleCv_.wait_for(lock, timeout, [this] { return pending_ == 0; });
}

void JobRunner::shutdown() {
    {
        std::scoped_lock lock(mutex_);
        if (shutdown_) return;
        shutdown_ = true;
    }

    stop();
    worker_.stop();

    // A run queued but never picked up still owns the status.
    if (!store_.snapshot().isIdle())
        store_.finishRun(Outcome::Cancelled, "Stopped by user", std::nullopt, store_.snapshot().next_sync_time);

    {
        std::scoped_lock lock(mutex_);
        pending_ = 0;
    }
    idleCv_.notify_all();

    Registry::sync()->info("[JobRunner] Shut down");
}
