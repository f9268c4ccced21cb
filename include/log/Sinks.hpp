#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace sm::log {

struct Event {
    enum class Level { Info, Warning, Error };

    std::string action;
    nlohmann::json details = nlohmann::json::object();
    Level level = Level::Info;
};

// One entry per state transition and per file/task outcome.
class ActivityLogger {
public:
    virtual ~ActivityLogger() = default;

    virtual void record(const Event& event) = 0;
};

// One entry per failure.
class ErrorLogger {
public:
    virtual ~ErrorLogger() = default;

    virtual void record(const std::string& message) = 0;
};

}
