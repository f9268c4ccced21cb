#pragma once

#include "jellyfin/MediaServerClient.hpp"

#include <string>

namespace sm::jellyfin {

// Jellyfin / Emby REST client over libcurl.
class Client final : public MediaServerClient {
public:
    Client(std::string serverUrl, std::string apiKey, unsigned int timeoutSeconds = 20);

    [[nodiscard]] std::vector<model::ScheduledTask> listTasks(bool includeHidden) override;
    void triggerTask(const model::ScheduledTask& task) override;
    [[nodiscard]] model::TaskStatus pollTask(const std::string& taskId) override;

    // Fetches the task list; throws on any failure.
    void testConnection();

private:
    std::string serverUrl_;
    std::string apiKey_;
    unsigned int timeoutSeconds_;
};

}
