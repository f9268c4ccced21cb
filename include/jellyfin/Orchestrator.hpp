#pragma once

#include "jellyfin/model/Config.hpp"
#include "sync/model/Status.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace sm::config { struct MediaServerConfig; }
namespace sm::concurrency { class CancelToken; }
namespace sm::log { class ActivityLogger; }
namespace sm::sync { class ProgressSink; }

namespace sm::jellyfin {

class MediaServerClient;

namespace model { struct ScheduledTask; struct TaskStatus; }

struct OrchestratorOptions {
    std::chrono::milliseconds poll_interval{1000};
    unsigned int max_poll_errors = 3; // consecutive poll errors that fail a task

    static OrchestratorOptions fromConfig(const config::MediaServerConfig& cfg);
};

// Runs the enabled selected tasks one after another: trigger, then poll to completion.
// A stop request skips what is still queued; a task already triggered keeps running
// on the server.
class Orchestrator {
public:
    Orchestrator(model::Config cfg,
                 MediaServerClient& client,
                 sync::ProgressSink& sink,
                 log::ActivityLogger& activity,
                 const concurrency::CancelToken& cancel,
                 OrchestratorOptions opts = {});

    // Throws InvalidConfig (untested connection), ConnectionFailure (task list
    // unavailable) or TaskFailure (unknown task, rejected trigger, polling gave up).
    sync::model::Outcome run();

private:
    model::Config cfg_;
    MediaServerClient& client_;
    sync::ProgressSink& sink_;
    log::ActivityLogger& activity_;
    const concurrency::CancelToken& cancel_;
    OrchestratorOptions opts_;

    [[nodiscard]] static const model::ScheduledTask* resolve(const model::SelectedTask& selected,
                                                             const std::vector<model::ScheduledTask>& serverTasks);

    void runTask(const model::SelectedTask& selected, const model::ScheduledTask& serverTask, size_t index, size_t total);
    void report(const std::string& taskName, double taskProgress, const std::string& state, size_t index, size_t total);
};

}
