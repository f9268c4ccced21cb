#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace sm::jellyfin::model {

struct SelectedTask {
    std::string key;
    std::string name;
    bool enabled{true};
    int order{0};
    std::optional<std::string> legacy_id;

    bool operator==(const SelectedTask&) const = default;
};

struct Config {
    std::string server_url;
    std::string api_key;
    bool include_hidden_tasks{false};
    std::vector<SelectedTask> selected_tasks;
    bool tested{false};

    // Enabled tasks in ascending order; equal orders keep their list position.
    [[nodiscard]] std::vector<SelectedTask> orderedEnabledTasks() const;

    bool operator==(const Config&) const = default;
};

// "host:8096/" -> "http://host:8096"
std::string normalizeUrl(const std::string& url);

void to_json(nlohmann::json& j, const SelectedTask& t);
void to_json(nlohmann::json& j, const Config& c);

}
