#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace pfs::config;

static spdlog::level::level_enum levelOr(const Node& node, const spdlog::level::level_enum def) {
    if (!node) return def;
    const auto lvl = spdlog::level::from_str(node.as<std::string>());
    // from_str answers "off" for anything it does not recognise
    if (lvl == spdlog::level::off && node.as<std::string>() != "off") return def;
    return lvl;
}

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<ApiConfig> {
    static Node encode(const ApiConfig& rhs) {
        Node node;
        node["base_url"] = rhs.base_url;
        node["upload_url"] = rhs.upload_url;
        node["user_agent"] = rhs.user_agent;
        node["connect_timeout_seconds"] = rhs.connect_timeout_seconds;
        node["transfer_timeout_seconds"] = rhs.transfer_timeout_seconds;
        node["use_tunnel"] = rhs.use_tunnel;
        return node;
    }

    static bool decode(const Node& node, ApiConfig& rhs) {
        if (!node.IsMap()) return false;
        const ApiConfig def;
        rhs.base_url = node["base_url"].as<std::string>(def.base_url);
        rhs.upload_url = node["upload_url"].as<std::string>(def.upload_url);
        rhs.user_agent = node["user_agent"].as<std::string>(def.user_agent);
        rhs.token = node["token"].as<std::string>("");
        rhs.connect_timeout_seconds = node["connect_timeout_seconds"].as<unsigned int>(def.connect_timeout_seconds);
        rhs.transfer_timeout_seconds = node["transfer_timeout_seconds"].as<unsigned int>(def.transfer_timeout_seconds);
        rhs.use_tunnel = node["use_tunnel"].as<bool>(def.use_tunnel);
        return true;
    }
};

template<>
struct convert<FuseConfig> {
    static Node encode(const FuseConfig& rhs) {
        Node node;
        node["attr_timeout_seconds"] = rhs.attr_timeout_seconds;
        node["entry_timeout_seconds"] = rhs.entry_timeout_seconds;
        node["max_idle_threads"] = rhs.max_idle_threads;
        node["allow_other"] = rhs.allow_other;
        node["read_only"] = rhs.read_only;
        return node;
    }

    static bool decode(const Node& node, FuseConfig& rhs) {
        if (!node.IsMap()) return false;
        const FuseConfig def;
        rhs.attr_timeout_seconds = node["attr_timeout_seconds"].as<double>(def.attr_timeout_seconds);
        rhs.entry_timeout_seconds = node["entry_timeout_seconds"].as<double>(def.entry_timeout_seconds);
        rhs.max_idle_threads = node["max_idle_threads"].as<unsigned int>(def.max_idle_threads);
        rhs.allow_other = node["allow_other"].as<bool>(def.allow_other);
        rhs.read_only = node["read_only"].as<bool>(def.read_only);
        return true;
    }
};

template<>
struct convert<StagingConfig> {
    static Node encode(const StagingConfig& rhs) {
        Node node;
        node["dir"] = rhs.dir.string();
        return node;
    }

    static bool decode(const Node& node, StagingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.dir = node["dir"].as<std::string>("");
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["putiofs"]    = to_std_string(spdlog::level::to_string_view(rhs.putiofs));
        node["fuse"]       = to_std_string(spdlog::level::to_string_view(rhs.fuse));
        node["filesystem"] = to_std_string(spdlog::level::to_string_view(rhs.filesystem));
        node["cloud"]      = to_std_string(spdlog::level::to_string_view(rhs.cloud));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        const SubsystemLogLevelsConfig def;
        rhs.putiofs    = levelOr(node["putiofs"], def.putiofs);
        rhs.fuse       = levelOr(node["fuse"], def.fuse);
        rhs.filesystem = levelOr(node["filesystem"], def.filesystem);
        rhs.cloud      = levelOr(node["cloud"], def.cloud);
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.levels.console_log_level));
        node["file_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.levels.file_log_level));
        node["subsystem_levels"] = convert<SubsystemLogLevelsConfig>::encode(rhs.levels.subsystem_levels);
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        const LogLevelsConfig def;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        rhs.levels.console_log_level = levelOr(node["console_log_level"], def.console_log_level);
        rhs.levels.file_log_level = levelOr(node["file_log_level"], def.file_log_level);
        if (const auto sub = node["subsystem_levels"])
            convert<SubsystemLogLevelsConfig>::decode(sub, rhs.levels.subsystem_levels);
        return true;
    }
};

} // namespace YAML
