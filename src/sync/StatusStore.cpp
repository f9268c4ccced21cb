#include "sync/StatusStore.hpp"
#include "util/timestamp.hpp"

#include <algorithm>

using namespace sm::sync;
using namespace sm::sync::model;

StatusStore::StatusStore(const size_t recentTransfersLimit) : recentLimit_(std::max<size_t>(1, recentTransfersLimit)) {}

SyncStatus StatusStore::snapshot() const {
    std::scoped_lock lock(mutex_);
    return status_;
}

State StatusStore::transitionLocked(const State to, const std::string& message) {
    const auto from = status_.state;
    status_.state = to;
    status_.message = message;
    return from;
}

void StatusStore::notify(const State from, const State to, const std::string& message) const {
    TransitionListener listener;
    {
        std::scoped_lock lock(mutex_);
        listener = listener_;
    }
    if (listener && from != to) listener(from, to, message);
}

void StatusStore::setTransitionListener(TransitionListener listener) {
    std::scoped_lock lock(mutex_);
    listener_ = std::move(listener);
}

void StatusStore::beginRun(const JobKind kind, const State initialState, const std::string& message) {
    State from;
    {
        std::scoped_lock lock(mutex_);
        from = transitionLocked(initialState, message);
        status_.active_kind = kind;
        status_.progress = 0;
        status_.stats = {};
        status_.active_file.reset();
        status_.target_path.reset();
        status_.download_speed.reset();
        status_.last_error.reset();
    }
    notify(from, initialState, message);
}

bool StatusStore::requestStop(const std::string& message) {
    State from;
    {
        std::scoped_lock lock(mutex_);
        if (status_.state == State::Idle || status_.state == State::Stopping) return false;
        from = transitionLocked(State::Stopping, message);
    }
    notify(from, State::Stopping, message);
    return true;
}

void StatusStore::markFailed(const std::string& error, const std::string& message) {
    State from;
    {
        std::scoped_lock lock(mutex_);
        from = transitionLocked(State::Error, message);
        status_.last_error = error;
    }
    notify(from, State::Error, message);
}

SyncStatus StatusStore::finishRun(const Outcome outcome, const std::string& message,
                                  const std::optional<std::time_t> lastSyncTime,
                                  const std::optional<std::time_t> nextSyncTime) {
    State from;
    SyncStatus out;
    {
        std::scoped_lock lock(mutex_);

        // Nothing stays in-progress once the run is over.
        const auto now = util::nowSeconds();
        for (auto& t : status_.recent_transfers) {
            if (t.finalized()) continue;
            t.status = FileTransfer::Status::Failure;
            t.completed_at = now;
            if (!t.error_message) t.error_message = "Interrupted";
        }

        from = transitionLocked(State::Idle, message);
        status_.last_outcome = outcome;
        status_.active_kind = JobKind::None;
        status_.progress = 0;
        status_.active_file.reset();
        status_.target_path.reset();
        status_.download_speed.reset();
        if (lastSyncTime) status_.last_sync_time = lastSyncTime;
        status_.next_sync_time = nextSyncTime;
        out = status_;
    }
    notify(from, State::Idle, message);
    return out;
}

void StatusStore::setNextSyncTime(const std::optional<std::time_t> t) {
    std::scoped_lock lock(mutex_);
    status_.next_sync_time = t;
}

void StatusStore::setLastSyncTime(const std::optional<std::time_t> t) {
    std::scoped_lock lock(mutex_);
    status_.last_sync_time = t;
}

void StatusStore::setState(const State state, const std::string& message) {
    State from;
    {
        std::scoped_lock lock(mutex_);
        if (status_.state == State::Stopping || status_.state == State::Idle) return;
        from = transitionLocked(state, message);
    }
    notify(from, state, message);
}

void StatusStore::setMessage(const std::string& message) {
    std::scoped_lock lock(mutex_);
    if (status_.state == State::Stopping) return;
    status_.message = message;
}

void StatusStore::setProgress(const int progress) {
    std::scoped_lock lock(mutex_);
    status_.progress = std::max(status_.progress, std::clamp(progress, 0, 100));
}

void StatusStore::setActive(std::optional<std::string> activeFile, std::optional<std::string> targetPath) {
    std::scoped_lock lock(mutex_);
    status_.active_file = std::move(activeFile);
    status_.target_path = std::move(targetPath);
}

void StatusStore::setSpeed(std::optional<std::string> speed) {
    std::scoped_lock lock(mutex_);
    status_.download_speed = std::move(speed);
}

uint64_t StatusStore::beginTransfer(const std::string& filename, const uint64_t size, const std::string& targetPath) {
    std::scoped_lock lock(mutex_);
    FileTransfer t;
    t.id = nextTransferId_++;
    t.filename = filename;
    t.size = size;
    t.target_path = targetPath;
    status_.recent_transfers.push_front(std::move(t));
    while (status_.recent_transfers.size() > recentLimit_) status_.recent_transfers.pop_back();
    return status_.recent_transfers.front().id;
}

void StatusStore::finalizeTransfer(const uint64_t id, const bool success, std::optional<std::string> errorMessage) {
    std::scoped_lock lock(mutex_);
    const auto it = std::ranges::find(status_.recent_transfers, id, &FileTransfer::id);
    if (it == status_.recent_transfers.end() || it->finalized()) return;

    it->status = success ? FileTransfer::Status::Success : FileTransfer::Status::Failure;
    it->completed_at = util::nowSeconds();
    it->error_message = std::move(errorMessage);
}

void StatusStore::recordDownloaded(const uint64_t bytes) {
    std::scoped_lock lock(mutex_);
    ++status_.stats.files_downloaded;
    status_.stats.bytes_downloaded += bytes;
}

void StatusStore::recordError() {
    std::scoped_lock lock(mutex_);
    ++status_.stats.errors;
}
