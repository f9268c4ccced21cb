#include "config/FileProvider.hpp"
#include "runtime/errors.hpp"
#include "util/timestamp.hpp"
#include "log/Registry.hpp"

#include <yaml-cpp/yaml.h>
#include <fmt/format.h>

using namespace sm::config;
using namespace sm::sync::model;
using namespace sm::runtime;
using namespace sm::log;

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    return s.substr(first, s.find_last_not_of(" \t\r\n") - first + 1);
}

std::string str(const YAML::Node& node, const char* key) {
    return node[key] && !node[key].IsNull() ? trim(node[key].as<std::string>()) : std::string{};
}

// Present values must convert; YAML::BadConversion surfaces as InvalidConfig.
template<typename T>
T value(const YAML::Node& node, const char* key, const T& fallback) {
    const auto n = node[key];
    return n && !n.IsNull() ? n.as<T>() : fallback;
}

void addSkipEntries(std::set<std::string>& out, const std::string& csv) {
    size_t start = 0;
    while (start <= csv.size()) {
        const auto end = csv.find(',', start);
        const auto item = trim(csv.substr(start, end == std::string::npos ? std::string::npos : end - start));
        if (!item.empty()) out.insert(item);
        if (end == std::string::npos) break;
        start = end + 1;
    }
}

}

namespace YAML {

template<>
struct convert<SftpConfig> {
    static bool decode(const Node& node, SftpConfig& rhs) {
        if (!node.IsMap()) return false;

        rhs.host = str(node, "host");
        rhs.username = str(node, "username");
        rhs.password = node["password"] && !node["password"].IsNull() ? node["password"].as<std::string>() : "";
        rhs.remote_root = str(node, "remote_root");
        rhs.local_root = str(node, "local_root");

        const auto port = value<long>(node, "port", 22);
        if (port < 1 || port > 65535) throw InvalidConfig(fmt::format("sftp.port must be between 1 and 65535 (got {})", port));
        rhs.port = static_cast<uint16_t>(port);

        const auto interval = value<long>(node, "sync_interval_minutes", DEFAULT_SYNC_INTERVAL_MINUTES);
        if (interval < MIN_SYNC_INTERVAL_MINUTES || interval > MAX_SYNC_INTERVAL_MINUTES)
            throw InvalidConfig(fmt::format("sftp.sync_interval_minutes must be between {} and {} (got {})",
                                            MIN_SYNC_INTERVAL_MINUTES, MAX_SYNC_INTERVAL_MINUTES, interval));
        rhs.sync_interval_minutes = static_cast<unsigned int>(interval);

        rhs.auto_sync_enabled = value(node, "auto_sync_enabled", false);

        rhs.skip_folders.clear();
        if (const auto skip = node["skip_folders"]; skip && !skip.IsNull()) {
            if (skip.IsSequence()) for (const auto& item : skip) addSkipEntries(rhs.skip_folders, item.as<std::string>());
            else addSkipEntries(rhs.skip_folders, skip.as<std::string>());
        }

        rhs.start_after.reset();
        if (const auto startAfter = str(node, "start_after"); !startAfter.empty()) {
            try {
                rhs.start_after = sm::util::parseIso8601(startAfter);
            } catch (const std::invalid_argument& e) {
                sm::log::Registry::config()->warn("[FileProvider] Ignoring sftp.start_after: {}", e.what());
            }
        }

        return true;
    }
};

template<>
struct convert<sm::jellyfin::model::SelectedTask> {
    static bool decode(const Node& node, sm::jellyfin::model::SelectedTask& rhs) {
        if (!node.IsMap()) return false;

        rhs.name = str(node, "name");
        rhs.enabled = value(node, "enabled", true);
        rhs.order = value(node, "order", rhs.order);
        if (const auto legacy = str(node, "legacy_id"); !legacy.empty()) rhs.legacy_id = legacy;
        else rhs.legacy_id.reset();

        rhs.key = str(node, "key");
        if (rhs.key.empty()) rhs.key = rhs.legacy_id.value_or(rhs.name);
        if (rhs.key.empty()) throw InvalidConfig("jellyfin.selected_tasks entries need a key or a name");
        if (rhs.name.empty()) rhs.name = rhs.key;

        return true;
    }
};

template<>
struct convert<sm::jellyfin::model::Config> {
    static bool decode(const Node& node, sm::jellyfin::model::Config& rhs) {
        if (!node.IsMap()) return false;

        rhs.server_url = sm::jellyfin::model::normalizeUrl(str(node, "server_url"));
        rhs.api_key = str(node, "api_key");
        rhs.include_hidden_tasks = value(node, "include_hidden_tasks", false);
        rhs.tested = value(node, "tested", false);

        rhs.selected_tasks.clear();
        if (const auto tasks = node["selected_tasks"]; tasks && !tasks.IsNull()) {
            if (!tasks.IsSequence()) throw InvalidConfig("jellyfin.selected_tasks must be a list");
            int index = 0;
            for (const auto& item : tasks) {
                sm::jellyfin::model::SelectedTask task;
                task.order = index++;
                convert<sm::jellyfin::model::SelectedTask>::decode(item, task);
                rhs.selected_tasks.push_back(std::move(task));
            }
        }

        return true;
    }
};

}

namespace sm::config {

Sources parseSources(const YAML::Node& root) {
    Sources out;
    if (!root || root.IsNull()) return out;
    if (!root.IsMap()) throw InvalidConfig("sources document must be a mapping");

    try {
        if (const auto node = root["sftp"]; node && !node.IsNull()) {
            SftpConfig cfg;
            if (!YAML::convert<SftpConfig>::decode(node, cfg)) throw InvalidConfig("sftp section must be a mapping");
            out.sftp = std::move(cfg);
        }

        if (const auto node = root["jellyfin"]; node && !node.IsNull()) {
            jellyfin::model::Config cfg;
            if (!YAML::convert<jellyfin::model::Config>::decode(node, cfg)) throw InvalidConfig("jellyfin section must be a mapping");
            if (!cfg.server_url.empty()) out.jellyfin = std::move(cfg);
        }
    } catch (const YAML::Exception& e) {
        throw InvalidConfig(fmt::format("Malformed sources document: {}", e.what()));
    }

    return out;
}

Sources parseSources(const std::string& yaml) {
    try {
        return parseSources(YAML::Load(yaml));
    } catch (const YAML::Exception& e) {
        throw InvalidConfig(fmt::format("Malformed sources document: {}", e.what()));
    }
}

FileProvider::FileProvider(std::filesystem::path path) : path_(std::move(path)) {}

bool FileProvider::reload() {
    Sources fresh;
    try {
        fresh = parseSources(YAML::LoadFile(path_.string()));
    } catch (const YAML::Exception& e) {
        Registry::config()->error("[FileProvider] Cannot read {}: {}", path_.string(), e.what());
        return false;
    } catch (const InvalidConfig& e) {
        Registry::config()->error("[FileProvider] Rejected {}: {}", path_.string(), e.what());
        return false;
    }

    bool sftpChanged;
    std::vector<Listener> listeners;
    {
        std::scoped_lock lock(mutex_);
        sftpChanged = fresh.sftp != sources_.sftp;
        sources_ = fresh;
        if (sftpChanged) listeners = listeners_;
    }

    Registry::config()->info("[FileProvider] Loaded {} (sftp: {}, jellyfin: {})", path_.string(),
                             fresh.sftp ? "configured" : "not configured",
                             fresh.jellyfin ? "configured" : "not configured");

    for (const auto& listener : listeners) listener(fresh.sftp);
    return true;
}

std::optional<SftpConfig> FileProvider::sftp() const {
    std::scoped_lock lock(mutex_);
    return sources_.sftp;
}

std::optional<jellyfin::model::Config> FileProvider::jellyfin() const {
    std::scoped_lock lock(mutex_);
    return sources_.jellyfin;
}

void FileProvider::onChanged(Listener listener) {
    std::scoped_lock lock(mutex_);
    listeners_.push_back(std::move(listener));
}

}
