#include "jellyfin/model/Config.hpp"

#include <algorithm>
#include <iterator>
#include <nlohmann/json.hpp>

namespace sm::jellyfin::model {

std::vector<SelectedTask> Config::orderedEnabledTasks() const {
    std::vector<SelectedTask> tasks;
    std::ranges::copy_if(selected_tasks, std::back_inserter(tasks), [](const SelectedTask& t) { return t.enabled; });
    std::ranges::stable_sort(tasks, {}, &SelectedTask::order);
    return tasks;
}

std::string normalizeUrl(const std::string& url) {
    const auto first = url.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    std::string out = url.substr(first, url.find_last_not_of(" \t\r\n") - first + 1);

    if (out.find("://") == std::string::npos) out = "http://" + out;
    while (!out.empty() && out.back() == '/') out.pop_back();
    return out;
}

void to_json(nlohmann::json& j, const SelectedTask& t) {
    j = {
        {"key", t.key},
        {"name", t.name},
        {"enabled", t.enabled},
        {"order", t.order}
    };
    if (t.legacy_id) j["legacy_id"] = *t.legacy_id;
}

// Api key is never serialized.
void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"server_url", c.server_url},
        {"include_hidden_tasks", c.include_hidden_tasks},
        {"selected_tasks", c.selected_tasks},
        {"tested", c.tested}
    };
}

}
