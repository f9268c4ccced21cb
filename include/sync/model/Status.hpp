#pragma once

#include <cstdint>
#include <ctime>
#include <deque>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace sm::sync::model {

enum class State : uint8_t {
    Idle,
    Connecting,
    Scanning,
    Downloading,
    Stopping,
    Error,
    Jellyfin
};

enum class Outcome : uint8_t {
    None,
    Success,
    Cancelled,
    Failed
};

enum class JobKind : uint8_t {
    None,
    Sync,
    Jellyfin
};

struct Stats {
    uint64_t files_downloaded{0};
    uint64_t bytes_downloaded{0};
    uint64_t errors{0};

    bool operator==(const Stats&) const = default;
};

struct FileTransfer {
    enum class Status : uint8_t { InProgress, Success, Failure };

    uint64_t id{0};
    std::string filename;
    uint64_t size{0};
    std::string target_path;
    Status status{Status::InProgress};
    std::optional<std::time_t> completed_at;
    std::optional<std::string> error_message;

    [[nodiscard]] bool finalized() const { return status != Status::InProgress; }

    bool operator==(const FileTransfer&) const = default;
};

struct SyncStatus {
    State state{State::Idle};
    std::string message{"Idle"};
    std::optional<std::string> active_file, target_path;
    int progress{0};
    std::optional<std::string> download_speed;
    Stats stats;
    std::deque<FileTransfer> recent_transfers; // newest first
    std::optional<std::string> last_error;
    std::optional<std::time_t> last_sync_time, next_sync_time;
    Outcome last_outcome{Outcome::None};
    JobKind active_kind{JobKind::None};

    [[nodiscard]] bool isIdle() const { return state == State::Idle; }

    bool operator==(const SyncStatus&) const = default;
};

std::string to_string(State s);
std::string to_string(Outcome o);
std::string to_string(JobKind k);
std::string to_string(FileTransfer::Status s);

void to_json(nlohmann::json& j, const Stats& s);
void to_json(nlohmann::json& j, const FileTransfer& t);
void to_json(nlohmann::json& j, const SyncStatus& s);

}
