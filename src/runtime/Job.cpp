#include "runtime/Job.hpp"
#include "runtime/JobRunner.hpp"
#include "runtime/errors.hpp"
#include "concurrency/CancelToken.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>

using namespace sm::runtime;
using namespace sm::sync::model;
using namespace sm::log;

Job::Job(JobRunner& runner, std::shared_ptr<concurrency::CancelToken> cancel)
    : runner_(runner), cancel_(std::move(cancel)) {}

void Job::operator()() {
    auto outcome = Outcome::Failed;
    std::optional<std::string> error;

    try {
        outcome = execute();
    } catch (const Cancelled&) {
        outcome = Outcome::Cancelled;
    } catch (const TaskFailure& e) {
        error = e.what();
        if (error->find(e.task_name) == std::string::npos) *error += fmt::format(" ({})", e.task_name);
    } catch (const std::exception& e) {
        error = e.what();
    }

    if (error) Registry::sync()->error("[Job] {} run failed: {}", to_string(kind()), *error);
    runner_.finishJob(kind(), error ? Outcome::Failed : outcome, error);
}

SyncJob::SyncJob(JobRunner& runner, std::shared_ptr<concurrency::CancelToken> cancel, SftpConfig cfg)
    : Job(runner, std::move(cancel)), cfg_(std::move(cfg)) {}

Outcome SyncJob::execute() {
    const auto fs = runner_.fsFactory_();
    if (!fs) throw ConnectionFailure("No remote filesystem backend available");

    sync::Transfer transfer(cfg_, *fs, runner_.store_, runner_.activity_, runner_.errors_, *cancel_,
                            runner_.opts_.transfer);
    return transfer.run();
}

JellyfinJob::JellyfinJob(JobRunner& runner, std::shared_ptr<concurrency::CancelToken> cancel, jellyfin::model::Config cfg)
    : Job(runner, std::move(cancel)), cfg_(std::move(cfg)) {}

Outcome JellyfinJob::execute() {
    const auto client = runner_.clientFactory_(cfg_);
    if (!client) throw ConnectionFailure("No media server client available");

    jellyfin::Orchestrator orchestrator(cfg_, *client, runner_.store_, runner_.activity_, *cancel_,
                                        runner_.opts_.jellyfin);
    return orchestrator.run();
}
