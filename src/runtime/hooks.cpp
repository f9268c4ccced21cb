#include "runtime/hooks.hpp"
#include "runtime/errors.hpp"
#include "config/Provider.hpp"
#include "log/Registry.hpp"
#include "log/Sinks.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

using namespace sm::sync::model;
using namespace sm::log;

namespace sm::runtime {

std::optional<std::time_t> loadLastSync(const std::filesystem::path& file) {
    std::ifstream in(file);
    if (!in.is_open()) return std::nullopt;

    long long value = 0;
    if (!(in >> value) || value <= 0) {
        Registry::syncmon()->warn("[hooks] Ignoring unreadable last sync marker {}", file.string());
        return std::nullopt;
    }
    return static_cast<std::time_t>(value);
}

void saveLastSync(const std::filesystem::path& file, const std::time_t t) {
    if (file.has_parent_path()) std::filesystem::create_directories(file.parent_path());

    const auto tmp = std::filesystem::path(file.string() + ".tmp");
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) throw std::runtime_error("Failed to open " + tmp.string());
        out << static_cast<long long>(t) << '\n';
        if (!out) throw std::runtime_error("Failed to write " + tmp.string());
    }
    std::filesystem::rename(tmp, file);
}

void persistLastSyncOnFinish(JobRunner& runner, const std::filesystem::path& file) {
    runner.addListener([file](const RunReport& report) {
        if (report.kind != JobKind::Sync) return;
        saveLastSync(file, report.finished_at);
    });
}

void logStatusOnFinish(JobRunner& runner) {
    runner.addListener([&runner](const RunReport&) {
        Registry::syncmon()->info("[Status] {}", nlohmann::json(runner.status()).dump());
    });
}

bool shouldChainJellyfin(const RunReport& report, const std::optional<jellyfin::model::Config>& cfg) {
    if (report.kind != JobKind::Sync || report.outcome != Outcome::Success) return false;
    if (report.stats.files_downloaded == 0) return false;
    if (!cfg || !cfg->tested) return false;
    return std::ranges::any_of(cfg->selected_tasks, &jellyfin::model::SelectedTask::enabled);
}

void chainJellyfinAfterSync(JobRunner& runner, config::Provider& provider, ActivityLogger& activity) {
    runner.addListener([&runner, &provider, &activity](const RunReport& report) {
        if (!shouldChainJellyfin(report, provider.jellyfin())) return;

        Registry::jellyfin()->info("[hooks] Launching Jellyfin tasks after successful sync");
        try {
            runner.start(JobKind::Jellyfin);
        } catch (const std::exception& e) {
            Registry::jellyfin()->warn("[hooks] Unable to start Jellyfin tasks after sync: {}", e.what());
            activity.record({
                .action = "jellyfin.post_sync_failed",
                .details = {{"error", e.what()}},
                .level = Event::Level::Warning
            });
        }
    });
}

}
