#include "logging/LogRegistry.hpp"
#include "config/Config.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <vector>

namespace pfs::logging {

void LogRegistry::init(const config::LoggingConfig& cnf, const bool debug) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    const auto consoleLevel = debug ? spdlog::level::debug : cnf.levels.console_log_level;

    // console
    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_level(consoleLevel);
    console->set_color_mode(spdlog::color_mode::automatic);
    console->set_pattern(LOG_FORMAT);
    console_sink_ = console;

    // main file sink (rotating), only when a log directory is configured
    if (!cnf.log_dir.empty()) {
        namespace fs = std::filesystem;
        if (!fs::exists(cnf.log_dir)) fs::create_directories(cnf.log_dir);
        main_log_path_ = cnf.log_dir / "putiofs.log";
        main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            main_log_path_.string(), main_max_bytes_, main_max_files_);
        main_file_sink_->set_level(debug ? spdlog::level::debug : cnf.levels.file_log_level);
        main_file_sink_->set_pattern(LOG_FORMAT);
    }

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        if (spdlog::get(name)) spdlog::drop(name);

        std::vector<spdlog::sink_ptr> sinks{console_sink_};
        if (main_file_sink_) sinks.push_back(main_file_sink_);

        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(debug ? spdlog::level::debug : lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("putiofs",    sub_levels.putiofs);
    makeLogger("fuse",       sub_levels.fuse);
    makeLogger("filesystem", sub_levels.filesystem);
    makeLogger("cloud",      sub_levels.cloud);

    initialized_ = true;
    get("putiofs")->debug("[LogRegistry] Initialized");
}

std::shared_ptr<spdlog::logger> LogRegistry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

bool LogRegistry::isInitialized() { return initialized_; }

}
