#include "sync/Transfer.hpp"
#include "sync/ProgressSink.hpp"
#include "remote/FileSystem.hpp"
#include "concurrency/CancelToken.hpp"
#include "config/Config.hpp"
#include "log/Registry.hpp"
#include "log/Sinks.hpp"
#include "runtime/errors.hpp"
#include "util/format.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <fmt/format.h>

using namespace sm::sync;
using namespace sm::sync::model;
using namespace sm::remote::model;
using namespace sm::runtime;
using namespace sm::log;
namespace fs = std::filesystem;

namespace {

// Disconnects on every exit path of a run.
struct ConnectionGuard {
    sm::remote::FileSystem& fs;
    ~ConnectionGuard() { fs.disconnect(); }
};

std::string joinRelative(const std::string& dir, const std::string& name) {
    return dir.empty() ? name : dir + "/" + name;
}

std::string normalizedRoot(std::string root) {
    while (root.size() > 1 && root.back() == '/') root.pop_back();
    return root.empty() ? "/" : root;
}

}

TransferOptions TransferOptions::fromConfig(const config::TransferConfig& cfg) {
    TransferOptions o;
    o.max_attempts = std::max(1u, cfg.max_attempts);
    o.initial_backoff = cfg.initial_backoff;
    o.backoff_multiplier = std::max(1.0, cfg.backoff_multiplier);
    o.chunk_size = static_cast<size_t>(std::clamp<uintmax_t>(cfg.chunk_size, 1, config::MAX_CHUNK_SIZE_BYTES));
    return o;
}

Transfer::Transfer(SftpConfig cfg,
                   remote::FileSystem& fs,
                   ProgressSink& sink,
                   ActivityLogger& activity,
                   ErrorLogger& errors,
                   const concurrency::CancelToken& cancel,
                   TransferOptions opts)
    : cfg_(std::move(cfg)), fs_(fs), sink_(sink), activity_(activity), errors_(errors), cancel_(cancel),
      opts_(opts) {
    opts_.max_attempts = std::max(1u, opts_.max_attempts);
    opts_.chunk_size = std::clamp<size_t>(opts_.chunk_size, 1, config::MAX_CHUNK_SIZE_BYTES);
}

Outcome Transfer::run() {
    try {
        cancel_.throwIfCancelled();

        sink_.setState(State::Connecting, fmt::format("Connecting to {}:{}", cfg_.host, cfg_.port));
        Registry::sync()->info("[Transfer] Connecting to {}@{}:{}", cfg_.username, cfg_.host, cfg_.port);
        fs_.connect(cfg_);
        ConnectionGuard guard{fs_};

        cancel_.throwIfCancelled();
        sink_.setState(State::Scanning, "Scanning remote tree...");
        const auto plan = scan();

        plannedFiles_ = plan.size();
        plannedBytes_ = 0;
        for (const auto& f : plan) plannedBytes_ += f.entry.size;

        Registry::sync()->info("[Transfer] {} file(s) to download ({} bytes)", plannedFiles_, plannedBytes_);

        cancel_.throwIfCancelled();
        sink_.setState(State::Downloading, fmt::format("Downloading {} file(s)", plannedFiles_));
        if (plan.empty()) sink_.setProgress(100);

        fs::create_directories(cfg_.local_root);

        for (const auto& file : plan) {
            cancel_.throwIfCancelled();
            downloadWithRetry(file);
            finishedBytes_ += file.entry.size;
            ++finishedFiles_;
            updateProgress(0);
        }

        sink_.setProgress(100);
        sink_.setActive(std::nullopt, std::nullopt);
        sink_.setSpeed(std::nullopt);
        return Outcome::Success;
    } catch (const Cancelled&) {
        Registry::sync()->info("[Transfer] Run cancelled after {} of {} file(s)", finishedFiles_, plannedFiles_);
        sink_.setActive(std::nullopt, std::nullopt);
        sink_.setSpeed(std::nullopt);
        return Outcome::Cancelled;
    }
}

std::vector<PlannedFile> Transfer::scan() {
    std::vector<PlannedFile> plan;
    walk(normalizedRoot(cfg_.remote_root), "", plan, true);
    return plan;
}

void Transfer::walk(const std::string& remoteDir, const std::string& relativeDir,
                    std::vector<PlannedFile>& plan, const bool isRoot) {
    cancel_.throwIfCancelled();

    std::vector<Entry> entries;
    try {
        entries = fs_.list(remoteDir);
    } catch (const Cancelled&) {
        throw;
    } catch (const std::exception& e) {
        if (isRoot) throw ConnectionFailure(fmt::format("Cannot list {}: {}", remoteDir, e.what()));
        const auto msg = fmt::format("Cannot list {}: {}", remoteDir, e.what());
        Registry::sync()->warn("[Transfer] {}", msg);
        errors_.record(msg);
        return;
    }

    std::ranges::sort(entries, {}, &Entry::name);

    for (const auto& entry : entries) {
        if (cfg_.skip_folders.contains(entry.name)) {
            Registry::sync()->debug("[Transfer] Skipping {} (skip list)", entry.path);
            continue;
        }

        const auto relative = joinRelative(relativeDir, entry.name);

        if (entry.is_dir) {
            walk(entry.path, relative, plan, false);
            continue;
        }

        auto localPath = fs::path(cfg_.local_root) / relative;
        if (shouldSkipFile(entry, localPath)) continue;

        plan.push_back({entry, relative, std::move(localPath)});
    }
}

bool Transfer::shouldSkipFile(const Entry& entry, const fs::path& localPath) const {
    if (cfg_.start_after && entry.mtime < *cfg_.start_after) {
        Registry::sync()->debug("[Transfer] Skipping {}; modified before cutoff", entry.path);
        return true;
    }

    std::error_code ec;
    if (fs::is_regular_file(localPath, ec) && fs::file_size(localPath, ec) == entry.size && !ec) {
        Registry::sync()->debug("[Transfer] Skipping {}; already present locally", entry.path);
        return true;
    }

    return false;
}

void Transfer::downloadWithRetry(const PlannedFile& file) {
    const auto target = file.local_path.string();
    const auto transferId = sink_.beginTransfer(file.entry.name, file.entry.size, target);
    sink_.setActive(file.entry.name, target);
    sink_.setMessage(fmt::format("Downloading {} ({}/{})", file.relative_path, finishedFiles_ + 1, plannedFiles_));

    const auto partial = fs::path(target + ".partial");
    auto backoff = opts_.initial_backoff;
    std::string lastError;

    for (unsigned int attempt = 1; attempt <= opts_.max_attempts; ++attempt) {
        try {
            const auto bytes = downloadOnce(file, partial);
            sink_.recordDownloaded(bytes);
            recordOutcome(file, transferId, true);
            Registry::sync()->info("[Transfer] Downloaded {} ({} bytes)", file.relative_path, bytes);
            return;
        } catch (const Cancelled& e) {
            std::error_code ec;
            fs::remove(partial, ec);
            recordOutcome(file, transferId, false, e.what());
            throw;
        } catch (const std::exception& e) {
            std::error_code ec;
            fs::remove(partial, ec);
            lastError = e.what();
            Registry::sync()->warn("[Transfer] Attempt {}/{} for {} failed: {}",
                                   attempt, opts_.max_attempts, file.relative_path, lastError);
        }

        if (attempt == opts_.max_attempts) break;

        if (cancel_.waitFor(backoff)) {
            recordOutcome(file, transferId, false, "Cancelled by user");
            throw Cancelled("Cancelled by user");
        }
        backoff = std::chrono::milliseconds(
            static_cast<int64_t>(std::llround(static_cast<double>(backoff.count()) * opts_.backoff_multiplier)));
    }

    sink_.recordError();
    recordOutcome(file, transferId, false, lastError);
    errors_.record(fmt::format("{} - {}", file.entry.path, lastError));
    Registry::sync()->error("[Transfer] Giving up on {} after {} attempt(s): {}",
                            file.relative_path, opts_.max_attempts, lastError);
}

uint64_t Transfer::downloadOnce(const PlannedFile& file, const fs::path& partial) {
    cancel_.throwIfCancelled();

    const auto expected = fs_.stat(file.entry.path).size;

    fs::create_directories(file.local_path.parent_path());
    std::error_code ec;
    fs::remove(partial, ec);

    auto reader = fs_.openRead(file.entry.path);
    std::ofstream out(partial, std::ios::binary | std::ios::trunc);
    if (!out) throw TransferFailure("Cannot open " + partial.string() + " for writing");

    std::vector<char> buf(opts_.chunk_size);
    uint64_t written = 0;
    speed_.reset();

    while (true) {
        cancel_.throwIfCancelled();
        const auto n = reader->read(buf.data(), buf.size());
        if (n == 0) break;

        out.write(buf.data(), static_cast<std::streamsize>(n));
        if (!out) throw TransferFailure("Write failed for " + partial.string());

        written += n;
        speed_.add(n);
        sink_.setSpeed(util::formatSpeed(speed_.bytesPerSecond()));
        updateProgress(std::min<uint64_t>(written, file.entry.size));
    }

    out.close();
    if (!out) throw TransferFailure("Cannot finalize " + partial.string());

    if (written != expected)
        throw TransferFailure(fmt::format("Size mismatch for {}: expected {} bytes, got {}", file.entry.path, expected, written));

    fs::rename(partial, file.local_path, ec);
    if (ec) throw TransferFailure("Cannot move " + partial.string() + " into place: " + ec.message());

    return written;
}

void Transfer::updateProgress(const uint64_t currentFileBytes) {
    if (plannedFiles_ == 0) return;

    double fraction;
    if (plannedBytes_ > 0)
        fraction = static_cast<double>(finishedBytes_ + currentFileBytes) / static_cast<double>(plannedBytes_);
    else
        fraction = static_cast<double>(finishedFiles_) / static_cast<double>(plannedFiles_);

    sink_.setProgress(static_cast<int>(std::clamp(fraction, 0.0, 1.0) * 100.0));
}

void Transfer::recordOutcome(const PlannedFile& file, const uint64_t transferId, const bool success,
                             const std::string& error) {
    sink_.finalizeTransfer(transferId, success, success ? std::nullopt : std::optional<std::string>(error));

    Event ev{
        .action = "transfer.recorded",
        .details = {
            {"filename", file.entry.name},
            {"target_path", file.local_path.string()},
            {"size", file.entry.size},
            {"status", success ? "success" : "failure"}
        },
        .level = success ? Event::Level::Info : Event::Level::Warning
    };
    if (!success) ev.details["error"] = error;
    activity_.record(ev);
}
