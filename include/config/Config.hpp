#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>

namespace pfs::config {

struct ApiConfig {
    std::string base_url = "https://api.put.io/v2";
    std::string upload_url = "https://upload.put.io/v2/files/upload";
    std::string user_agent = "putiofs - FUSE bridge to Put.io";
    std::string token;
    unsigned int connect_timeout_seconds = 30;
    unsigned int transfer_timeout_seconds = 3600;
    bool use_tunnel = true;
};

struct FuseConfig {
    double attr_timeout_seconds = 3600.0;   // staleness up to this long is accepted
    double entry_timeout_seconds = 3600.0;
    unsigned int max_idle_threads = 10;
    bool allow_other = false;
    bool read_only = false;
};

struct StagingConfig {
    std::filesystem::path dir{};  // empty => std::filesystem::temp_directory_path()
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum putiofs    = spdlog::level::info;  // startup/shutdown
    spdlog::level::level_enum fuse       = spdlog::level::warn;  // kernel dispatch, only failures
    spdlog::level::level_enum filesystem = spdlog::level::warn;  // node/handle errors
    spdlog::level::level_enum cloud      = spdlog::level::warn;  // put.io API errors
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::info;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir{};
    LogLevelsConfig levels;
};

struct Config {
    ApiConfig api;
    FuseConfig fuse;
    StagingConfig staging;
    LoggingConfig logging;

    [[nodiscard]] std::filesystem::path stagingDir() const;
};

Config loadConfig(const std::filesystem::path& path);

// $XDG_CONFIG_HOME/putiofs/config.yaml, falling back to ~/.config/putiofs/config.yaml
std::optional<std::filesystem::path> defaultConfigPath();

} // namespace pfs::config
