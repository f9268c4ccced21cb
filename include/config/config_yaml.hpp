#pragma once

#include "config/Config.hpp"
#include "config/util.hpp"

#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace sm::config;

template<>
struct convert<DaemonConfig> {
    static bool decode(const Node& node, DaemonConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.data_dir = node["data_dir"].as<std::string>("/var/lib/syncmon");
        rhs.sources_path = node["sources_path"].as<std::string>("/etc/syncmon/sources.yaml");
        rhs.start_on_launch = node["start_on_launch"].as<bool>(true);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.syncmon = spdlog::level::from_str(node["syncmon"].as<std::string>("info"));
        rhs.sync = spdlog::level::from_str(node["sync"].as<std::string>("info"));
        rhs.jellyfin = spdlog::level::from_str(node["jellyfin"].as<std::string>("info"));
        rhs.scheduler = spdlog::level::from_str(node["scheduler"].as<std::string>("info"));
        rhs.remote = spdlog::level::from_str(node["remote"].as<std::string>("warn"));
        rhs.config = spdlog::level::from_str(node["config"].as<std::string>("info"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("info"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("/var/log/syncmon");
        if (node["levels"]) rhs.levels = node["levels"].as<LogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<TransferConfig> {
    static bool decode(const Node& node, TransferConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.max_attempts = std::max(1u, node["max_attempts"].as<unsigned int>(3));
        rhs.initial_backoff = parseDurationMs(node["initial_backoff"].as<std::string>("1s"));
        rhs.backoff_multiplier = std::max(1.0, node["backoff_multiplier"].as<double>(2.0));
        rhs.chunk_size = std::clamp<uintmax_t>(parseSizeToBytes(node["chunk_size"].as<std::string>("64KB")),
                                               1, MAX_CHUNK_SIZE_BYTES);
        rhs.recent_transfers_limit = node["recent_transfers_limit"].as<size_t>(200);
        rhs.connect_timeout_seconds = node["connect_timeout_seconds"].as<unsigned int>(20);
        return true;
    }
};

template<>
struct convert<MediaServerConfig> {
    static bool decode(const Node& node, MediaServerConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.poll_interval = parseDurationMs(node["poll_interval"].as<std::string>("1s"));
        rhs.max_poll_errors = node["max_poll_errors"].as<unsigned int>(3);
        rhs.request_timeout_seconds = node["request_timeout_seconds"].as<unsigned int>(20);
        return true;
    }
};

}
