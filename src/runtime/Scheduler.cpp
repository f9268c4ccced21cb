#include "runtime/Scheduler.hpp"
#include "runtime/JobRunner.hpp"
#include "runtime/errors.hpp"
#include "log/Registry.hpp"
#include "log/Sinks.hpp"
#include "util/timestamp.hpp"

#include <algorithm>
#include <chrono>

using namespace sm::runtime;
using namespace sm::sync::model;
using namespace sm::log;
using namespace std::chrono;

Scheduler::Scheduler(JobRunner& runner, ActivityLogger& activity, Clock clock)
    : AsyncService("Scheduler"), runner_(runner), activity_(activity),
      clock_(clock ? std::move(clock) : Clock(util::nowSeconds)) {}

Scheduler::~Scheduler() { stop(); }

std::time_t Scheduler::intervalSeconds(const SftpConfig& cfg) {
    return static_cast<std::time_t>(std::max(1u, cfg.sync_interval_minutes)) * 60;
}

void Scheduler::onConfigChanged(const std::optional<SftpConfig>& cfg) {
    arm(cfg, true, false);
}

void Scheduler::prime(const std::optional<SftpConfig>& cfg, const bool startOnLaunch) {
    arm(cfg, startOnLaunch, startOnLaunch);
}

void Scheduler::arm(const std::optional<SftpConfig>& cfg, const bool allowImmediate, const bool launch) {
    const bool neverSynced = !runner_.status().last_sync_time.has_value();

    std::optional<std::time_t> next;
    bool immediate = false;
    {
        std::scoped_lock lock(mutex_);
        ++generation_;
        cfg_ = cfg;
        launchFire_ = false;

        if (cfg && cfg->auto_sync_enabled) {
            const auto now = clock_();
            // Every launch syncs right away; a config change only when nothing anchors the schedule yet.
            immediate = allowImmediate && (launch || (neverSynced && !cfg->start_after));
            if (immediate) {
                next_ = now;
                launchFire_ = launch;
            } else {
                next_ = std::max(cfg->start_after.value_or(now), now) + intervalSeconds(*cfg);
            }
        } else {
            next_.reset();
        }
        next = next_;
        runner_.setNextSyncTime(next);
    }

    if (immediate) Registry::scheduler()->info("[Scheduler] {}, first run fires immediately",
                                               launch ? "Daemon started" : "No previous sync");
    announce(next);
    wake();
}

bool Scheduler::fireDue() {
    std::time_t fireTime;
    uint64_t generation;
    bool launch;
    {
        std::scoped_lock lock(mutex_);
        const auto now = clock_();
        if (!next_ || !cfg_ || now < *next_) return false;
        fireTime = *next_;
        generation = generation_;
        launch = launchFire_;
        launchFire_ = false;

        // Re-armed before the run starts so a finishing run already reports the next fire.
        const auto interval = intervalSeconds(*cfg_);
        auto at = fireTime + interval;
        while (at <= now) at += interval;
        next_ = at;
        runner_.setNextSyncTime(next_);
    }

    bool disarm = false;
    try {
        runner_.start(JobKind::Sync);
        activity_.record({
            .action = launch ? "autosync.restart_trigger" : "autosync.run_triggered",
            .details = {{"scheduled_for", util::timestampToString(fireTime)}}
        });
        Registry::scheduler()->info("[Scheduler] Automatic sync started");
    } catch (const Conflict& e) {
        activity_.record({
            .action = launch ? "autosync.restart_skipped" : "autosync.run_skipped",
            .details = {{"reason", e.what()}},
            .level = Event::Level::Warning
        });
        Registry::scheduler()->info("[Scheduler] Worker busy, skipping this run: {}", e.what());
    } catch (const InvalidConfig& e) {
        activity_.record({
            .action = "autosync.run_cancelled",
            .details = {{"error", e.what()}},
            .level = Event::Level::Warning
        });
        Registry::scheduler()->warn("[Scheduler] Configuration unusable, auto sync disarmed: {}", e.what());
        disarm = true;
    } catch (const std::exception& e) {
        activity_.record({
            .action = launch ? "autosync.restart_failed" : "autosync.run_failed",
            .details = {{"error", e.what()}},
            .level = Event::Level::Error
        });
        Registry::scheduler()->error("[Scheduler] Automatic sync could not start: {}", e.what());
    }

    std::optional<std::time_t> next;
    {
        std::scoped_lock lock(mutex_);
        if (generation != generation_) return true; // a newer config already published
        if (disarm) {
            next_.reset();
            runner_.setNextSyncTime(next_);
        }
        next = next_;
    }

    announce(next);
    return true;
}

std::optional<std::time_t> Scheduler::nextFireTime() const {
    std::scoped_lock lock(mutex_);
    return next_;
}

void Scheduler::announce(const std::optional<std::time_t> next) {
    if (next) {
        activity_.record({
            .action = "autosync.timer_armed",
            .details = {{"next_run", util::timestampToString(*next)}}
        });
        Registry::scheduler()->info("[Scheduler] Next automatic sync at {}", util::timestampToString(*next));
    } else {
        activity_.record({.action = "autosync.cancelled"});
        Registry::scheduler()->info("[Scheduler] Automatic sync disarmed");
    }
}

void Scheduler::runLoop() {
    while (!interruptFlag_.load()) {
        try {
            fireDue();
        } catch (const std::exception& e) {
            Registry::scheduler()->error("[Scheduler] Fire failed: {}", e.what());
        }

        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, seconds(1), [this] { return interruptFlag_.load() || woken_; });
        woken_ = false;
    }
}

void Scheduler::wake() {
    {
        std::scoped_lock lock(mutex_);
        woken_ = true;
    }
    cv_.notify_all();
}
