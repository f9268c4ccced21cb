#pragma once

#include "concurrency/AsyncService.hpp"
#include "sync/model/SftpConfig.hpp"

#include <condition_variable>
#include <cstdint>
#include <ctime>
#include <functional>
#include <mutex>
#include <optional>

namespace sm::log { class ActivityLogger; }

namespace sm::runtime {

class JobRunner;

// Interval timer for automatic syncs. Holds at most one armed fire time, tied to
// the latest SftpConfig snapshot; a busy worker makes a fire skip, never queue.
class Scheduler final : public concurrency::AsyncService {
public:
    using Clock = std::function<std::time_t()>;

    Scheduler(JobRunner& runner, log::ActivityLogger& activity, Clock clock = {});
    ~Scheduler() override;

    // Disarms, then re-arms from the new snapshot (or stays disarmed). With no
    // start_after and no previous sync the first fire is due right away.
    void onConfigChanged(const std::optional<sync::model::SftpConfig>& cfg);

    // First arm at daemon start. With startOnLaunch and auto sync enabled the first
    // fire is due right away; otherwise the config-change rule applies without
    // its immediate fire.
    void prime(const std::optional<sync::model::SftpConfig>& cfg, bool startOnLaunch = true);

    // Fires if armed and due. Returns true when a fire was attempted.
    bool fireDue();

    [[nodiscard]] std::optional<std::time_t> nextFireTime() const;

protected:
    void runLoop() override;
    void wake() override;

private:
    JobRunner& runner_;
    log::ActivityLogger& activity_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool woken_{false};

    std::optional<sync::model::SftpConfig> cfg_;
    std::optional<std::time_t> next_;
    uint64_t generation_{0};
    bool launchFire_{false};

    void arm(const std::optional<sync::model::SftpConfig>& cfg, bool allowImmediate, bool launch);
    [[nodiscard]] static std::time_t intervalSeconds(const sync::model::SftpConfig& cfg);
    // next_sync_time itself is pushed to the runner under mutex_; this only logs.
    void announce(std::optional<std::time_t> next);
};

}
