#pragma once

#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace sm::jellyfin::model {

struct ScheduledTask {
    std::string id;
    std::string key;
    std::string name;
    std::optional<std::string> description;
    bool is_hidden{false};
};

struct TaskStatus {
    std::string state{"Unknown"};
    double progress{0.0}; // 0-100

    // Server reports the task as no longer running.
    [[nodiscard]] bool finished() const;

    [[nodiscard]] static TaskStatus completed() { return {"Completed", 100.0}; }
};

void from_json(const nlohmann::json& j, ScheduledTask& t);
void from_json(const nlohmann::json& j, TaskStatus& s);

}
