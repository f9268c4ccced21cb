#pragma once

#include "jellyfin/model/ScheduledTask.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace sm::jellyfin {

namespace model { struct Config; }

// Task-server API. Transport problems throw runtime::ConnectionFailure; a
// rejected trigger throws runtime::TaskFailure.
class MediaServerClient {
public:
    virtual ~MediaServerClient() = default;

    [[nodiscard]] virtual std::vector<model::ScheduledTask> listTasks(bool includeHidden) = 0;
    virtual void triggerTask(const model::ScheduledTask& task) = 0;
    [[nodiscard]] virtual model::TaskStatus pollTask(const std::string& taskId) = 0;
};

using MediaServerClientFactory = std::function<std::unique_ptr<MediaServerClient>(const model::Config&)>;

}
