#include "sync/model/Status.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

using namespace sm::util;

namespace sm::sync::model {

std::string to_string(const State s) {
    switch (s) {
        case State::Idle: return "idle";
        case State::Connecting: return "connecting";
        case State::Scanning: return "scanning";
        case State::Downloading: return "downloading";
        case State::Stopping: return "stopping";
        case State::Error: return "error";
        case State::Jellyfin: return "jellyfin";
    }
    return "unknown";
}

std::string to_string(const Outcome o) {
    switch (o) {
        case Outcome::None: return "none";
        case Outcome::Success: return "success";
        case Outcome::Cancelled: return "cancelled";
        case Outcome::Failed: return "failed";
    }
    return "unknown";
}

std::string to_string(const JobKind k) {
    switch (k) {
        case JobKind::None: return "none";
        case JobKind::Sync: return "sync";
        case JobKind::Jellyfin: return "jellyfin";
    }
    return "unknown";
}

std::string to_string(const FileTransfer::Status s) {
    switch (s) {
        case FileTransfer::Status::InProgress: return "in-progress";
        case FileTransfer::Status::Success: return "success";
        case FileTransfer::Status::Failure: return "failure";
    }
    return "unknown";
}

void to_json(nlohmann::json& j, const Stats& s) {
    j = {
        {"files_downloaded", s.files_downloaded},
        {"bytes_downloaded", s.bytes_downloaded},
        {"errors", s.errors}
    };
}

void to_json(nlohmann::json& j, const FileTransfer& t) {
    j = {
        {"id", t.id},
        {"filename", t.filename},
        {"size", t.size},
        {"target_path", t.target_path},
        {"status", to_string(t.status)}
    };
    if (t.completed_at) j["completed_at"] = timestampToString(*t.completed_at);
    if (t.error_message) j["error_message"] = *t.error_message;
}

void to_json(nlohmann::json& j, const SyncStatus& s) {
    j = {
        {"state", to_string(s.state)},
        {"message", s.message},
        {"progress", s.progress},
        {"stats", s.stats},
        {"recent_transfers", s.recent_transfers},
        {"last_outcome", to_string(s.last_outcome)},
        {"active_kind", to_string(s.active_kind)}
    };

    const auto optional = [&j](const char* key, const std::optional<std::string>& v) {
        j[key] = v ? nlohmann::json(*v) : nlohmann::json(nullptr);
    };
    optional("active_file", s.active_file);
    optional("target_path", s.target_path);
    optional("download_speed", s.download_speed);
    optional("last_error", s.last_error);

    j["last_sync_time"] = s.last_sync_time ? nlohmann::json(timestampToString(*s.last_sync_time)) : nlohmann::json(nullptr);
    j["next_sync_time"] = s.next_sync_time ? nlohmann::json(timestampToString(*s.next_sync_time)) : nlohmann::json(nullptr);
}

}
