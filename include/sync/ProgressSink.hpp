#pragma once

#include "sync/model/Status.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace sm::sync {

// What a running engine reports into the shared run status.
class ProgressSink {
public:
    virtual ~ProgressSink() = default;

    // Ignored once a stop was requested.
    virtual void setState(model::State state, const std::string& message) = 0;
    virtual void setMessage(const std::string& message) = 0;

    // Clamped to [0, 100]; never lowers the value within a run.
    virtual void setProgress(int progress) = 0;

    virtual void setActive(std::optional<std::string> activeFile, std::optional<std::string> targetPath) = 0;
    virtual void setSpeed(std::optional<std::string> speed) = 0;

    // Adds an in-progress FileTransfer, returns its id.
    virtual uint64_t beginTransfer(const std::string& filename, uint64_t size, const std::string& targetPath) = 0;

    // Success or failure, exactly once per id. Later calls are ignored.
    virtual void finalizeTransfer(uint64_t id, bool success, std::optional<std::string> errorMessage = std::nullopt) = 0;

    virtual void recordDownloaded(uint64_t bytes) = 0;
    virtual void recordError() = 0;
};

}
