#include "jellyfin/Orchestrator.hpp"
#include "jellyfin/MediaServerClient.hpp"
#include "concurrency/CancelToken.hpp"
#include "config/Config.hpp"
#include "sync/ProgressSink.hpp"
#include "log/Registry.hpp"
#include "log/Sinks.hpp"
#include "runtime/errors.hpp"

#include <algorithm>
#include <fmt/format.h>

using namespace sm::jellyfin;
using namespace sm::jellyfin::model;
using namespace sm::sync::model;
using namespace sm::runtime;
using namespace sm::log;

OrchestratorOptions OrchestratorOptions::fromConfig(const config::MediaServerConfig& cfg) {
    OrchestratorOptions o;
    o.poll_interval = cfg.poll_interval;
    o.max_poll_errors = cfg.max_poll_errors;
    return o;
}

Orchestrator::Orchestrator(model::Config cfg,
                           MediaServerClient& client,
                           sync::ProgressSink& sink,
                           ActivityLogger& activity,
                           const concurrency::CancelToken& cancel,
                           const OrchestratorOptions opts)
    : cfg_(std::move(cfg)), client_(client), sink_(sink), activity_(activity), cancel_(cancel), opts_(opts) {}

Outcome Orchestrator::run() {
    if (!cfg_.tested) throw InvalidConfig("Jellyfin connection has not been tested");

    const auto tasks = cfg_.orderedEnabledTasks();
    if (tasks.empty()) throw InvalidConfig("No Jellyfin tasks have been selected.");

    try {
        cancel_.throwIfCancelled();

        std::vector<ScheduledTask> serverTasks;
        try {
            serverTasks = client_.listTasks(cfg_.include_hidden_tasks);
        } catch (const ConnectionFailure&) {
            throw;
        } catch (const std::exception& e) {
            throw ConnectionFailure(fmt::format("Cannot fetch Jellyfin task list: {}", e.what()));
        }

        activity_.record({.action = "jellyfin.run_started", .details = {{"total_tasks", tasks.size()}}});
        Registry::jellyfin()->info("[Orchestrator] Running {} task(s)", tasks.size());

        for (size_t i = 0; i < tasks.size(); ++i) {
            cancel_.throwIfCancelled();

            const auto& selected = tasks[i];
            const auto* serverTask = resolve(selected, serverTasks);
            if (!serverTask)
                throw TaskFailure(selected.name, fmt::format("Task '{}' was not found on the server.", selected.name));

            runTask(selected, *serverTask, i + 1, tasks.size());
        }
    } catch (const Cancelled&) {
        Registry::jellyfin()->info("[Orchestrator] Stop requested, remaining tasks skipped");
        return Outcome::Cancelled;
    }

    sink_.setProgress(100);
    return Outcome::Success;
}

const ScheduledTask* Orchestrator::resolve(const SelectedTask& selected, const std::vector<ScheduledTask>& serverTasks) {
    const auto byKey = std::ranges::find(serverTasks, selected.key, &ScheduledTask::key);
    if (!selected.key.empty() && byKey != serverTasks.end()) return &*byKey;

    const auto byName = std::ranges::find(serverTasks, selected.name, &ScheduledTask::name);
    if (!selected.name.empty() && byName != serverTasks.end()) return &*byName;

    if (selected.legacy_id) {
        const auto byId = std::ranges::find(serverTasks, *selected.legacy_id, &ScheduledTask::id);
        if (byId != serverTasks.end()) return &*byId;
    }

    return nullptr;
}

void Orchestrator::runTask(const SelectedTask& selected, const ScheduledTask& serverTask,
                           const size_t index, const size_t total) {
    const auto& name = selected.name.empty() ? serverTask.name : selected.name;

    report(name, 0.0, "Starting", index, total);
    activity_.record({.action = "jellyfin.task_start", .details = {{"name", name}, {"order", index}}});

    try {
        client_.triggerTask(serverTask);
    } catch (const TaskFailure&) {
        throw;
    } catch (const std::exception& e) {
        throw TaskFailure(name, fmt::format("Failed to start '{}': {}", name, e.what()));
    }

    unsigned int consecutiveErrors = 0;
    while (true) {
        cancel_.throwIfCancelled();

        TaskStatus status;
        try {
            status = client_.pollTask(serverTask.id);
        } catch (const std::exception& e) {
            ++consecutiveErrors;
            Registry::jellyfin()->warn("[Orchestrator] Poll {} of '{}' failed: {}", consecutiveErrors, name, e.what());
            if (consecutiveErrors >= opts_.max_poll_errors)
                throw TaskFailure(name, fmt::format("Failed to poll '{}': {}", name, e.what()));
            if (cancel_.waitFor(opts_.poll_interval * 2)) cancel_.throwIfCancelled();
            continue;
        }

        consecutiveErrors = 0;
        report(name, status.progress, status.state, index, total);

        if (status.finished()) {
            activity_.record({
                .action = "jellyfin.task_complete",
                .details = {{"name", name}, {"progress", status.progress}, {"state", status.state}}
            });
            Registry::jellyfin()->info("[Orchestrator] Task '{}' finished ({})", name, status.state);
            return;
        }

        if (cancel_.waitFor(opts_.poll_interval)) cancel_.throwIfCancelled();
    }
}

void Orchestrator::report(const std::string& taskName, const double taskProgress, const std::string& state,
                          const size_t index, const size_t total) {
    const auto denom = static_cast<double>(std::max<size_t>(total, 1));
    const auto overall = static_cast<int>(((static_cast<double>(index - 1) + taskProgress / 100.0) / denom) * 100.0);

    sink_.setMessage(fmt::format("Jellyfin tasks ({}/{}) - {}", index, total, state));
    sink_.setActive(taskName, fmt::format("{} ({:.0f}%)", state, taskProgress));
    sink_.setProgress(std::clamp(overall, 0, 100));
    sink_.setSpeed(std::nullopt);
}
