#pragma once

#include "sync/ProgressSink.hpp"

#include <ctime>
#include <functional>
#include <mutex>

namespace sm::sync {

// Owner of the single SyncStatus. Every accessor copies under one mutex, so
// readers never observe a half-applied update.
class StatusStore final : public ProgressSink {
public:
    using TransitionListener = std::function<void(model::State from, model::State to, const std::string& message)>;

    explicit StatusStore(size_t recentTransfersLimit = 200);

    [[nodiscard]] model::SyncStatus snapshot() const;

    // Run lifecycle, driven by the JobRunner.
    void beginRun(model::JobKind kind, model::State initialState, const std::string& message);
    bool requestStop(const std::string& message);
    void markFailed(const std::string& error, const std::string& message);
    model::SyncStatus finishRun(model::Outcome outcome, const std::string& message,
                                std::optional<std::time_t> lastSyncTime,
                                std::optional<std::time_t> nextSyncTime);

    void setNextSyncTime(std::optional<std::time_t> t);
    void setLastSyncTime(std::optional<std::time_t> t);

    void setTransitionListener(TransitionListener listener);

    // ProgressSink
    void setState(model::State state, const std::string& message) override;
    void setMessage(const std::string& message) override;
    void setProgress(int progress) override;
    void setActive(std::optional<std::string> activeFile, std::optional<std::string> targetPath) override;
    void setSpeed(std::optional<std::string> speed) override;
    uint64_t beginTransfer(const std::string& filename, uint64_t size, const std::string& targetPath) override;
    void finalizeTransfer(uint64_t id, bool success, std::optional<std::string> errorMessage = std::nullopt) override;
    void recordDownloaded(uint64_t bytes) override;
    void recordError() override;

private:
    mutable std::mutex mutex_;
    model::SyncStatus status_;
    size_t recentLimit_;
    uint64_t nextTransferId_{1};
    TransitionListener listener_;

    // Applies a state change with mutex_ held; returns the previous state.
    model::State transitionLocked(model::State to, const std::string& message);
    void notify(model::State from, model::State to, const std::string& message) const;
};

}
