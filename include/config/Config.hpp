#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace sm::config {

constexpr static uintmax_t MAX_CHUNK_SIZE_BYTES = 1024 * 1024; // 1 MiB
constexpr static uintmax_t DEFAULT_CHUNK_SIZE_BYTES = 64 * 1024;

struct DaemonConfig {
    std::filesystem::path data_dir = "/var/lib/syncmon";
    std::filesystem::path sources_path = "/etc/syncmon/sources.yaml";
    bool start_on_launch = true;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum syncmon   = spdlog::level::info;   // Startup, shutdown, signals
    spdlog::level::level_enum sync      = spdlog::level::info;   // Run transitions, per-file failures
    spdlog::level::level_enum jellyfin  = spdlog::level::info;
    spdlog::level::level_enum scheduler = spdlog::level::info;
    spdlog::level::level_enum remote    = spdlog::level::warn;   // SFTP/HTTP transport noise
    spdlog::level::level_enum config    = spdlog::level::info;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::info;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/var/log/syncmon";
    LogLevelsConfig levels;
};

struct TransferConfig {
    unsigned int max_attempts = 3;
    std::chrono::milliseconds initial_backoff{1000};
    double backoff_multiplier = 2.0;
    uintmax_t chunk_size = DEFAULT_CHUNK_SIZE_BYTES;
    size_t recent_transfers_limit = 200;
    unsigned int connect_timeout_seconds = 20;
};

struct MediaServerConfig {
    std::chrono::milliseconds poll_interval{1000};
    unsigned int max_poll_errors = 3;
    unsigned int request_timeout_seconds = 20;
};

struct Config {
    DaemonConfig daemon;
    LoggingConfig logging;
    TransferConfig transfer;
    MediaServerConfig jellyfin;
};

Config loadConfig(const std::filesystem::path& path);

void to_json(nlohmann::json& j, const Config& c);
void to_json(nlohmann::json& j, const DaemonConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void to_json(nlohmann::json& j, const LogLevelsConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);
void to_json(nlohmann::json& j, const TransferConfig& c);
void to_json(nlohmann::json& j, const MediaServerConfig& c);

}
