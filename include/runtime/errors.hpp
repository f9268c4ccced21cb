#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace sm::runtime {

// Another run already occupies the worker. Nothing was mutated.
struct Conflict : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Missing credentials or paths, or a Jellyfin run without a tested connection.
struct InvalidConfig : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Remote host or media server unreachable. Fatal to the run.
struct ConnectionFailure : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Single file could not be transferred. Retried, then recorded; the run continues.
struct TransferFailure : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Single media-server task failed. Aborts the remaining queue.
struct TaskFailure : std::runtime_error {
    std::string task_name;

    TaskFailure(std::string taskName, const std::string& what)
        : std::runtime_error(what), task_name(std::move(taskName)) {}
};

// User requested stop, observed at a checkpoint.
struct Cancelled : std::runtime_error {
    using std::runtime_error::runtime_error;
};

}
