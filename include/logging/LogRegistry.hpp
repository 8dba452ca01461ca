#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace pfs::config {
struct LoggingConfig;
}

namespace pfs::logging {

class LogRegistry {
public:
    // Initialize all loggers with sinks/levels. debug forces every subsystem to debug.
    static void init(const config::LoggingConfig& cnf, bool debug = false);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> putiofs()  { return get("putiofs"); }
    static std::shared_ptr<spdlog::logger> fuse()     { return get("fuse"); }
    static std::shared_ptr<spdlog::logger> fs()       { return get("filesystem"); }
    static std::shared_ptr<spdlog::logger> cloud()    { return get("cloud"); }

    [[nodiscard]] static bool isInitialized();

private:
    static constexpr auto LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";
    static constexpr std::size_t main_max_bytes_ = 10 * 1024 * 1024;
    static constexpr std::size_t main_max_files_ = 5;

    static inline bool initialized_ = false;
    static inline std::filesystem::path main_log_path_;
    static inline spdlog::sink_ptr console_sink_;
    static inline spdlog::sink_ptr main_file_sink_;
};

} // namespace pfs::logging
