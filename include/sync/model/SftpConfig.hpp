#pragma once

#include <cstdint>
#include <ctime>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace sm::sync::model {

constexpr static unsigned int MIN_SYNC_INTERVAL_MINUTES = 5;
constexpr static unsigned int MAX_SYNC_INTERVAL_MINUTES = 1440;
constexpr static unsigned int DEFAULT_SYNC_INTERVAL_MINUTES = 240;

struct SftpConfig {
    std::string host;
    uint16_t port{22};
    std::string username;
    std::string password;
    std::string remote_root;
    std::string local_root;
    std::set<std::string> skip_folders;
    unsigned int sync_interval_minutes{DEFAULT_SYNC_INTERVAL_MINUTES};
    bool auto_sync_enabled{false};
    std::optional<std::time_t> start_after;

    // Names of required fields that are empty.
    [[nodiscard]] std::vector<std::string> missingFields() const;

    [[nodiscard]] bool isComplete() const { return missingFields().empty(); }

    bool operator==(const SftpConfig&) const = default;
};

// Password is never serialized.
void to_json(nlohmann::json& j, const SftpConfig& c);

}
