// Runtime
#include "runtime/JobRunner.hpp"
#include "runtime/Scheduler.hpp"
#include "runtime/hooks.hpp"

// Backends
#include "remote/Sftp.hpp"
#include "jellyfin/Client.hpp"

// Config + logging
#include "config/ConfigRegistry.hpp"
#include "config/FileProvider.hpp"
#include "log/Registry.hpp"
#include "log/ActivityLog.hpp"

// Libraries
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <thread>
#include <nlohmann/json.hpp>

using namespace sm;
using namespace sm::config;
using namespace sm::log;
using namespace sm::runtime;
using namespace sm::sync::model;

namespace {
std::atomic<bool> shouldExit = false;
std::atomic<bool> reloadRequested = false;
std::atomic<bool> syncRequested = false;
std::atomic<bool> jellyfinRequested = false;

void signalHandler(const int signum) {
    switch (signum) {
        case SIGHUP: reloadRequested = true; break;
        case SIGUSR1: syncRequested = true; break;
        case SIGUSR2: jellyfinRequested = true; break;
        default: shouldExit = true; break;
    }
}

void manualStart(JobRunner& runner, const JobKind kind) {
    try {
        runner.start(kind);
    } catch (const std::exception& e) {
        Registry::syncmon()->warn("[!] Manual {} run refused: {}", to_string(kind), e.what());
    }
}

int testJellyfin(FileProvider& provider, const MediaServerConfig& mediaCfg) {
    const auto cfg = provider.jellyfin();
    if (!cfg) {
        Registry::syncmon()->error("[-] Jellyfin is not configured in {}", provider.path().string());
        return EXIT_FAILURE;
    }

    try {
        jellyfin::Client(cfg->server_url, cfg->api_key, mediaCfg.request_timeout_seconds).testConnection();
    } catch (const std::exception& e) {
        Registry::syncmon()->error("[-] Jellyfin connection test failed: {}", e.what());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
}

int main(const int argc, char** argv) {
    std::string configPath = "/etc/syncmon/config.yaml";
    bool testJellyfinOnly = false;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--test-jellyfin") == 0) testJellyfinOnly = true;
        else configPath = argv[i];
    }

    try {
        ConfigRegistry::init(configPath);
        const auto& cfg = ConfigRegistry::get();
        Registry::init(cfg.logging, cfg.daemon.data_dir);

        Registry::syncmon()->info("[*] Initializing syncmon...");
        Registry::config()->debug("[*] Effective configuration: {}", nlohmann::json(cfg).dump());

        FileProvider provider(cfg.daemon.sources_path);
        if (!provider.reload())
            Registry::syncmon()->warn("[!] Sources file {} could not be loaded; waiting for SIGHUP", cfg.daemon.sources_path.string());

        if (testJellyfinOnly) return testJellyfin(provider, cfg.jellyfin);

        ActivityLog activity(Registry::activity());
        ErrorLog errors(Registry::errors());

        RunnerOptions opts;
        opts.transfer = sync::TransferOptions::fromConfig(cfg.transfer);
        opts.jellyfin = jellyfin::OrchestratorOptions::fromConfig(cfg.jellyfin);
        opts.recent_transfers_limit = cfg.transfer.recent_transfers_limit;

        const auto connectTimeout = cfg.transfer.connect_timeout_seconds;
        const auto requestTimeout = cfg.jellyfin.request_timeout_seconds;

        JobRunner runner(
            provider,
            [connectTimeout] { return std::make_unique<remote::Sftp>(connectTimeout); },
            [requestTimeout](const jellyfin::model::Config& c) {
                return std::make_unique<jellyfin::Client>(c.server_url, c.api_key, requestTimeout);
            },
            activity, errors, opts);

        const auto lastSyncFile = cfg.daemon.data_dir / "last_sync";
        runner.setLastSyncTime(loadLastSync(lastSyncFile));
        persistLastSyncOnFinish(runner, lastSyncFile);
        logStatusOnFinish(runner);
        chainJellyfinAfterSync(runner, provider, activity);

        Scheduler scheduler(runner, activity);
        runner.setNextRunSource([&scheduler] { return scheduler.nextFireTime(); });
        provider.onChanged([&scheduler](const std::optional<SftpConfig>& sftp) { scheduler.onConfigChanged(sftp); });

        scheduler.prime(provider.sftp(), cfg.daemon.start_on_launch);
        scheduler.start();

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);
        std::signal(SIGHUP, signalHandler);
        std::signal(SIGUSR1, signalHandler);
        std::signal(SIGUSR2, signalHandler);

        Registry::syncmon()->info("[✓] syncmon started");

        while (!shouldExit) {
            if (reloadRequested.exchange(false)) {
                Registry::syncmon()->info("[*] SIGHUP received, reloading sources and reopening logs");
                Registry::reopenFileSinks();
                if (!provider.reload()) Registry::syncmon()->warn("[!] Reload failed, previous sources stay in effect");
            }
            if (syncRequested.exchange(false)) manualStart(runner, JobKind::Sync);
            if (jellyfinRequested.exchange(false)) manualStart(runner, JobKind::Jellyfin);

            std::this_thread::sleep_for(std::chrono::milliseconds(250));
        }

        Registry::syncmon()->info("[*] Shutting down syncmon...");
        scheduler.stop();
        runner.shutdown();
        Registry::syncmon()->info("[✓] syncmon shut down cleanly.");

        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        if (Registry::isInitialized()) Registry::syncmon()->error("[-] Failed to run syncmon: {}", e.what());
        else std::fprintf(stderr, "syncmon: %s\n", e.what());
        return EXIT_FAILURE;
    }
}
