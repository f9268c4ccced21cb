#include "log/ActivityLog.hpp"

using namespace sm::log;

ActivityLog::ActivityLog(std::shared_ptr<spdlog::logger> logger) : logger_(std::move(logger)) {}

void ActivityLog::record(const Event& event) {
    nlohmann::json entry = {{"action", event.action}};
    if (event.details.is_object()) entry.update(event.details);
    else if (!event.details.is_null()) entry["details"] = event.details;

    const auto line = entry.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    switch (event.level) {
        case Event::Level::Info: logger_->info("{}", line); break;
        case Event::Level::Warning: logger_->warn("{}", line); break;
        case Event::Level::Error: logger_->error("{}", line); break;
    }
}

ErrorLog::ErrorLog(std::shared_ptr<spdlog::logger> logger) : logger_(std::move(logger)) {}

void ErrorLog::record(const std::string& message) {
    logger_->error("{}", message);
}
