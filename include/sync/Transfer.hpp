#pragma once

#include "remote/model/Entry.hpp"
#include "sync/model/SftpConfig.hpp"
#include "sync/model/Status.hpp"
#include "sync/SpeedMeter.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace sm::config { struct TransferConfig; }
namespace sm::concurrency { class CancelToken; }
namespace sm::remote { class FileSystem; }
namespace sm::log { class ActivityLogger; class ErrorLogger; }

namespace sm::sync {

class ProgressSink;

struct TransferOptions {
    unsigned int max_attempts = 3;
    std::chrono::milliseconds initial_backoff{1000};
    double backoff_multiplier = 2.0;
    size_t chunk_size = 64 * 1024;

    static TransferOptions fromConfig(const config::TransferConfig& cfg);
};

struct PlannedFile {
    remote::model::Entry entry;
    std::string relative_path;
    std::filesystem::path local_path;
};

// One mirror run: connect, scan the remote tree, download what is missing.
// Connection problems throw runtime::ConnectionFailure; single-file problems are
// retried, recorded and skipped; a stop request ends the run with Outcome::Cancelled.
class Transfer {
public:
    Transfer(model::SftpConfig cfg,
             remote::FileSystem& fs,
             ProgressSink& sink,
             log::ActivityLogger& activity,
             log::ErrorLogger& errors,
             const concurrency::CancelToken& cancel,
             TransferOptions opts = {});

    model::Outcome run();

    // Depth-first, name-ordered list of files that need downloading. Requires a connected fs.
    [[nodiscard]] std::vector<PlannedFile> scan();

private:
    model::SftpConfig cfg_;
    remote::FileSystem& fs_;
    ProgressSink& sink_;
    log::ActivityLogger& activity_;
    log::ErrorLogger& errors_;
    const concurrency::CancelToken& cancel_;
    TransferOptions opts_;

    SpeedMeter speed_;
    uint64_t plannedBytes_{0};
    uint64_t finishedBytes_{0};
    size_t plannedFiles_{0};
    size_t finishedFiles_{0};

    void walk(const std::string& remoteDir, const std::string& relativeDir, std::vector<PlannedFile>& plan, bool isRoot);
    [[nodiscard]] bool shouldSkipFile(const remote::model::Entry& entry, const std::filesystem::path& localPath) const;

    void downloadWithRetry(const PlannedFile& file);
    uint64_t downloadOnce(const PlannedFile& file, const std::filesystem::path& partial);

    void updateProgress(uint64_t currentFileBytes);
    void recordOutcome(const PlannedFile& file, uint64_t transferId, bool success, const std::string& error = {});
};

}
