#pragma once

#include "concurrency/Task.hpp"
#include "sync/model/SftpConfig.hpp"
#include "sync/model/Status.hpp"
#include "jellyfin/model/Config.hpp"

#include <memory>

namespace sm::concurrency { class CancelToken; }

namespace sm::runtime {

class JobRunner;

// One run on the worker. operator() executes the job and always hands the
// outcome back to the runner, whatever execute() throws.
struct Job : concurrency::Task {
    Job(JobRunner& runner, std::shared_ptr<concurrency::CancelToken> cancel);
    ~Job() override = default;

    void operator()() override;

    [[nodiscard]] virtual sync::model::JobKind kind() const = 0;

protected:
    JobRunner& runner_;
    std::shared_ptr<concurrency::CancelToken> cancel_;

    virtual sync::model::Outcome execute() = 0;
};

struct SyncJob final : Job {
    SyncJob(JobRunner& runner, std::shared_ptr<concurrency::CancelToken> cancel, sync::model::SftpConfig cfg);

    [[nodiscard]] sync::model::JobKind kind() const override { return sync::model::JobKind::Sync; }

protected:
    sync::model::Outcome execute() override;

private:
    sync::model::SftpConfig cfg_;
};

struct JellyfinJob final : Job {
    JellyfinJob(JobRunner& runner, std::shared_ptr<concurrency::CancelToken> cancel, jellyfin::model::Config cfg);

    [[nodiscard]] sync::model::JobKind kind() const override { return sync::model::JobKind::Jellyfin; }

protected:
    sync::model::Outcome execute() override;

private:
    jellyfin::model::Config cfg_;
};

}
