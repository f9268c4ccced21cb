#include "sync/model/SftpConfig.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

namespace sm::sync::model {

std::vector<std::string> SftpConfig::missingFields() const {
    std::vector<std::string> missing;
    if (host.empty()) missing.emplace_back("host");
    if (username.empty()) missing.emplace_back("username");
    if (password.empty()) missing.emplace_back("password");
    if (remote_root.empty()) missing.emplace_back("remote_root");
    if (local_root.empty()) missing.emplace_back("local_root");
    return missing;
}

void to_json(nlohmann::json& j, const SftpConfig& c) {
    j = {
        {"host", c.host},
        {"port", c.port},
        {"username", c.username},
        {"remote_root", c.remote_root},
        {"local_root", c.local_root},
        {"skip_folders", c.skip_folders},
        {"sync_interval_minutes", c.sync_interval_minutes},
        {"auto_sync_enabled", c.auto_sync_enabled},
        {"start_after", c.start_after ? nlohmann::json(util::timestampToString(*c.start_after)) : nlohmann::json(nullptr)}
    };
}

}
