#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace sm::config {

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    YAML::Node root = YAML::LoadFile(path.string());

    if (auto node = root["daemon"]) YAML::convert<DaemonConfig>::decode(node, cfg.daemon);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);
    if (auto node = root["transfer"]) YAML::convert<TransferConfig>::decode(node, cfg.transfer);
    if (auto node = root["jellyfin"]) YAML::convert<MediaServerConfig>::decode(node, cfg.jellyfin);

    return cfg;
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"daemon", c.daemon},
        {"logging", c.logging},
        {"transfer", c.transfer},
        {"jellyfin", c.jellyfin}
    };
}

void to_json(nlohmann::json& j, const DaemonConfig& c) {
    j = {
        {"data_dir", c.data_dir.string()},
        {"sources_path", c.sources_path.string()},
        {"start_on_launch", c.start_on_launch}
    };
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_dir", c.log_dir.string()},
        {"levels", c.levels}
    };
}

void to_json(nlohmann::json& j, const LogLevelsConfig& c) {
    j = {
        {"console_log_level", to_std_string(spdlog::level::to_string_view(c.console_log_level))},
        {"file_log_level", to_std_string(spdlog::level::to_string_view(c.file_log_level))},
        {"subsystem_levels", c.subsystem_levels}
    };
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    j = {
        {"syncmon", to_std_string(spdlog::level::to_string_view(c.syncmon))},
        {"sync", to_std_string(spdlog::level::to_string_view(c.sync))},
        {"jellyfin", to_std_string(spdlog::level::to_string_view(c.jellyfin))},
        {"scheduler", to_std_string(spdlog::level::to_string_view(c.scheduler))},
        {"remote", to_std_string(spdlog::level::to_string_view(c.remote))},
        {"config", to_std_string(spdlog::level::to_string_view(c.config))}
    };
}

void to_json(nlohmann::json& j, const TransferConfig& c) {
    j = {
        {"max_attempts", c.max_attempts},
        {"initial_backoff", durationToStr(c.initial_backoff)},
        {"backoff_multiplier", c.backoff_multiplier},
        {"chunk_size", bytesToSizeStr(c.chunk_size)},
        {"recent_transfers_limit", c.recent_transfers_limit},
        {"connect_timeout_seconds", c.connect_timeout_seconds}
    };
}

void to_json(nlohmann::json& j, const MediaServerConfig& c) {
    j = {
        {"poll_interval", durationToStr(c.poll_interval)},
        {"max_poll_errors", c.max_poll_errors},
        {"request_timeout_seconds", c.request_timeout_seconds}
    };
}

}
