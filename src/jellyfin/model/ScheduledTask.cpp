#include "jellyfin/model/ScheduledTask.hpp"

#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>

namespace sm::jellyfin::model {

namespace {
    std::string lowerCopy(std::string s) {
        std::ranges::transform(s, s.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }
}

bool TaskStatus::finished() const {
    if (progress >= 100.0) return true;
    const auto s = lowerCopy(state);
    return s == "idle" || s == "completed" || s == "completedwitherrors";
}

void from_json(const nlohmann::json& j, ScheduledTask& t) {
    t.id = j.value("Id", "");
    t.key = j.value("Key", "");
    if (t.key.empty()) t.key = t.id;
    t.name = j.value("Name", "");
    if (j.contains("Description") && j["Description"].is_string()) t.description = j["Description"].get<std::string>();
    else t.description.reset();
    t.is_hidden = j.value("IsHidden", false);
}

void from_json(const nlohmann::json& j, TaskStatus& s) {
    s.state = j.value("State", "Unknown");
    if (j.contains("CurrentProgressPercentage") && j["CurrentProgressPercentage"].is_number())
        s.progress = std::clamp(j["CurrentProgressPercentage"].get<double>(), 0.0, 100.0);
    else
        s.progress = 0.0;
}

}
