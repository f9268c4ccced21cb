#pragma once

#include "runtime/JobRunner.hpp"
#include "jellyfin/model/Config.hpp"

#include <ctime>
#include <filesystem>
#include <optional>

namespace sm::config { class Provider; }
namespace sm::log { class ActivityLogger; }

namespace sm::runtime {

// <data_dir>/last_sync holds the epoch seconds of the last finished sync.
std::optional<std::time_t> loadLastSync(const std::filesystem::path& file);
void saveLastSync(const std::filesystem::path& file, std::time_t t);

void persistLastSyncOnFinish(JobRunner& runner, const std::filesystem::path& file);

// A sync that downloaded something is followed by the selected Jellyfin tasks,
// provided the connection was tested and at least one task is enabled.
[[nodiscard]] bool shouldChainJellyfin(const RunReport& report, const std::optional<jellyfin::model::Config>& cfg);

// Logs the full status snapshot as JSON on the syncmon logger after every run.
void logStatusOnFinish(JobRunner& runner);

void chainJellyfinAfterSync(JobRunner& runner, config::Provider& provider, log::ActivityLogger& activity);

}
