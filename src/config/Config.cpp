#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <cstdlib>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace pfs::config {

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    YAML::Node root;

    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to load config file " + path.string() + ": " + e.what());
    }

    if (auto node = root["api"]) YAML::convert<ApiConfig>::decode(node, cfg.api);
    if (auto node = root["fuse"]) YAML::convert<FuseConfig>::decode(node, cfg.fuse);
    if (auto node = root["staging"]) YAML::convert<StagingConfig>::decode(node, cfg.staging);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    return cfg;
}

std::optional<std::filesystem::path> defaultConfigPath() {
    namespace fs = std::filesystem;

    fs::path base;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) base = xdg;
    else if (const char* home = std::getenv("HOME"); home && *home) base = fs::path(home) / ".config";
    else return std::nullopt;

    const auto candidate = base / "putiofs" / "config.yaml";
    std::error_code ec;
    if (!fs::is_regular_file(candidate, ec)) return std::nullopt;
    return candidate;
}

std::filesystem::path Config::stagingDir() const {
    if (!staging.dir.empty()) return staging.dir;
    return std::filesystem::temp_directory_path();
}

} // namespace pfs::config
