#pragma once

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>

namespace pfs::config {
struct Config;
}

namespace pfs::runtime {

inline constexpr int USAGE_EXIT_CODE = 2;

struct CommandLine {
    std::optional<std::string> token;
    std::optional<std::filesystem::path> configPath;
    std::filesystem::path mountPoint;
    bool debug = false;
    bool readOnly = false;
    bool showHelp = false;
};

// nullopt on an unknown option or when the mount path count is not exactly one
// (a help request needs no mount path).
std::optional<CommandLine> parseCommandLine(int argc, char** argv);

void printUsage(std::ostream& os, const std::string& program);

// Config file (explicit -config, else the default location if present) with
// command-line values layered on top.
config::Config resolveConfig(const CommandLine& cli);

}
