#pragma once

#include "log/Sinks.hpp"

#include <memory>
#include <spdlog/logger.h>

namespace sm::log {

// {"action": ..., <details>} per line through the file-only "activity" logger.
class ActivityLog final : public ActivityLogger {
public:
    explicit ActivityLog(std::shared_ptr<spdlog::logger> logger);

    void record(const Event& event) override;

private:
    std::shared_ptr<spdlog::logger> logger_;
};

// "<timestamp> - <message>" per line through the file-only "errors" logger.
class ErrorLog final : public ErrorLogger {
public:
    explicit ErrorLog(std::shared_ptr<spdlog::logger> logger);

    void record(const std::string& message) override;

private:
    std::shared_ptr<spdlog::logger> logger_;
};

}
