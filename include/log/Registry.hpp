#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/basic_file_sink.h>

namespace sm::config { struct LoggingConfig; }

namespace sm::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels. Activity and error logs land in dataDir.
    static void init(const config::LoggingConfig& cfg, const std::filesystem::path& dataDir);

    // Console-only loggers; activity and error loggers discard everything.
    static void initForTesting(spdlog::level::level_enum level = spdlog::level::warn);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> syncmon()   { return get("syncmon"); }
    static std::shared_ptr<spdlog::logger> sync()      { return get("sync"); }
    static std::shared_ptr<spdlog::logger> jellyfin()  { return get("jellyfin"); }
    static std::shared_ptr<spdlog::logger> scheduler() { return get("scheduler"); }
    static std::shared_ptr<spdlog::logger> remote()    { return get("remote"); }
    static std::shared_ptr<spdlog::logger> config()    { return get("config"); }
    static std::shared_ptr<spdlog::logger> activity()  { return get("activity"); }
    static std::shared_ptr<spdlog::logger> errors()    { return get("errors"); }

    [[nodiscard]] static bool isInitialized();

    // Swap every file sink for a freshly opened one (after external log rotation).
    static void reopenFileSinks();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";
    static constexpr const auto* ACTIVITY_FORMAT = "%Y-%m-%d %H:%M:%S | %l | %v";
    static constexpr const auto* ERROR_FORMAT = "%Y-%m-%d %H:%M:%S - %v";

    static inline bool initialized_ = false;

    static inline std::filesystem::path main_log_path_;
    static inline std::filesystem::path activity_log_path_;
    static inline std::filesystem::path error_log_path_;

    // keep the shared sinks so we can swap them later
    static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;
    static inline std::shared_ptr<spdlog::sinks::basic_file_sink_mt> activity_file_sink_;
    static inline std::shared_ptr<spdlog::sinks::basic_file_sink_mt> error_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;

    static void replaceSinkEverywhere_(const std::shared_ptr<spdlog::sinks::sink>& old_sink,
                                       const std::shared_ptr<spdlog::sinks::sink>& new_sink);
};

}
