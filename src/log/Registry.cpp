#include "log/Registry.hpp"
#include "config/Config.hpp"

#include <spdlog/sinks/null_sink.h>

#include <stdexcept>
#include <vector>

namespace sm::log {

void Registry::init(const config::LoggingConfig& cfg, const std::filesystem::path& dataDir) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    main_log_path_ = cfg.log_dir / "syncmon.log";
    activity_log_path_ = dataDir / "activity.log";
    error_log_path_ = dataDir / "sync_errors.log";

    namespace fs = std::filesystem;
    if (!fs::exists(cfg.log_dir)) fs::create_directories(cfg.log_dir);
    if (!fs::exists(dataDir)) fs::create_directories(dataDir);

    // console
    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(cfg.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    // main file sink (rotating)
    main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        main_log_path_.string(), main_max_bytes_, main_max_files_);
    main_file_sink_->set_level(cfg.levels.file_log_level);
    main_file_sink_->set_pattern(LOG_FORMAT);

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(
            name, spdlog::sinks_init_list{console_sink_, main_file_sink_});
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cfg.levels.subsystem_levels;
    makeLogger("syncmon",   sub_levels.syncmon);
    makeLogger("sync",      sub_levels.sync);
    makeLogger("jellyfin",  sub_levels.jellyfin);
    makeLogger("scheduler", sub_levels.scheduler);
    makeLogger("remote",    sub_levels.remote);
    makeLogger("config",    sub_levels.config);

    // activity + errors: file-only sinks (append)
    auto makeFileOnly = [](const std::string& name, const std::shared_ptr<spdlog::sinks::basic_file_sink_mt>& sink) {
        std::vector<spdlog::sink_ptr> sinks = { sink };
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::info);
        logger->flush_on(spdlog::level::info);
        spdlog::register_logger(logger);
    };

    activity_file_sink_ = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        activity_log_path_.string(), /*truncate=*/false);
    activity_file_sink_->set_pattern(ACTIVITY_FORMAT);
    makeFileOnly("activity", activity_file_sink_);

    error_file_sink_ = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        error_log_path_.string(), /*truncate=*/false);
    error_file_sink_->set_pattern(ERROR_FORMAT);
    makeFileOnly("errors", error_file_sink_);

    initialized_ = true;
    spdlog::info("[LogRegistry] Initialized");
}

void Registry::initForTesting(const spdlog::level::level_enum level) {
    if (initialized_) return;

    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(level);
    console_sink_->set_pattern(LOG_FORMAT);

    for (const auto* name : {"syncmon", "sync", "jellyfin", "scheduler", "remote", "config"}) {
        const auto logger = std::make_shared<spdlog::logger>(name, console_sink_);
        logger->set_level(level);
        spdlog::register_logger(logger);
    }

    const auto discard = std::make_shared<spdlog::sinks::null_sink_mt>();
    spdlog::register_logger(std::make_shared<spdlog::logger>("activity", discard));
    spdlog::register_logger(std::make_shared<spdlog::logger>("errors", discard));

    initialized_ = true;
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] Registry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

bool Registry::isInitialized() { return initialized_; }

void Registry::replaceSinkEverywhere_(
    const std::shared_ptr<spdlog::sinks::sink>& old_sink,
    const std::shared_ptr<spdlog::sinks::sink>& new_sink)
{
    spdlog::apply_all([&](const std::shared_ptr<spdlog::logger>& lg) {
        auto sinks_copy = lg->sinks();
        bool touched = false;
        for (auto& s : sinks_copy) {
            if (s.get() == old_sink.get()) {
                s = new_sink;
                touched = true;
            }
        }
        if (touched) {
            lg->flush();
            lg->sinks() = std::move(sinks_copy);
        }
    });
}

void Registry::reopenFileSinks() {
    if (!initialized_ || !main_file_sink_) return;

    auto freshMain = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        main_log_path_.string(), main_max_bytes_, main_max_files_);
    freshMain->set_level(main_file_sink_->level());
    freshMain->set_pattern(LOG_FORMAT);
    replaceSinkEverywhere_(main_file_sink_, freshMain);
    main_file_sink_ = std::move(freshMain);

    auto freshActivity = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        activity_log_path_.string(), /*truncate=*/false);
    freshActivity->set_pattern(ACTIVITY_FORMAT);
    replaceSinkEverywhere_(activity_file_sink_, freshActivity);
    activity_file_sink_ = std::move(freshActivity);

    auto freshErrors = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        error_log_path_.string(), /*truncate=*/false);
    freshErrors->set_pattern(ERROR_FORMAT);
    replaceSinkEverywhere_(error_file_sink_, freshErrors);
    error_file_sink_ = std::move(freshErrors);

    spdlog::info("[LogRegistry] Reopened file sinks");
}

}
