#include "runtime/CommandLine.hpp"
#include "config/Config.hpp"

#define FUSE_USE_VERSION 35

#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <fuse_opt.h>

namespace pfs::runtime {

namespace {

struct RawOptions {
    char* token = nullptr;
    char* config = nullptr;
    int debug = 0;
    int readonly = 0;
    int help = 0;
    char* mountpoint = nullptr;
    int positional = 0;
    int invalid = 0;
};

#define PFS_OPT(t, p, v) { t, offsetof(RawOptions, p), v }

// "-x=%s" precedes "-x %s" so the latter never captures "=value" as its argument
const fuse_opt OPTION_TABLE[] = {
    PFS_OPT("-token=%s", token, 0),
    PFS_OPT("--token=%s", token, 0),
    PFS_OPT("-token %s", token, 0),
    PFS_OPT("--token %s", token, 0),
    PFS_OPT("-config=%s", config, 0),
    PFS_OPT("--config=%s", config, 0),
    PFS_OPT("-config %s", config, 0),
    PFS_OPT("--config %s", config, 0),
    PFS_OPT("-debug", debug, 1),
    PFS_OPT("--debug", debug, 1),
    PFS_OPT("-readonly", readonly, 1),
    PFS_OPT("--readonly", readonly, 1),
    PFS_OPT("-h", help, 1),
    PFS_OPT("--help", help, 1),
    FUSE_OPT_END
};

#undef PFS_OPT

int collect(void* data, const char* arg, const int key, fuse_args* outargs) {
    (void)outargs;
    auto* raw = static_cast<RawOptions*>(data);

    if (key == FUSE_OPT_KEY_NONOPT) {
        if (raw->positional++ == 0) raw->mountpoint = strdup(arg);
        return 0;
    }

    raw->invalid = 1;
    return 0;
}

}

std::optional<CommandLine> parseCommandLine(const int argc, char** argv) {
    fuse_args args = FUSE_ARGS_INIT(argc, argv);
    RawOptions raw;

    const int rc = fuse_opt_parse(&args, &raw, OPTION_TABLE, collect);
    fuse_opt_free_args(&args);

    CommandLine cli;
    if (raw.token) cli.token = std::string(raw.token);
    if (raw.config) cli.configPath = std::filesystem::path(raw.config);
    if (raw.mountpoint) cli.mountPoint = raw.mountpoint;
    std::free(raw.token);
    std::free(raw.config);
    std::free(raw.mountpoint);

    if (rc != 0 || raw.invalid) return std::nullopt;

    cli.debug = raw.debug != 0;
    cli.readOnly = raw.readonly != 0;
    cli.showHelp = raw.help != 0;

    if (cli.showHelp) return cli;
    if (raw.positional != 1) return std::nullopt;
    return cli;
}

void printUsage(std::ostream& os, const std::string& program) {
    os << "Usage: " << program << " [options] MOUNTPOINT\n"
       << "\n"
       << "Options:\n"
       << "  -token <token>     put.io access token (overrides the config file)\n"
       << "  -config <path>     YAML config file (default: $XDG_CONFIG_HOME/putiofs/config.yaml)\n"
       << "  -readonly          mount read-only\n"
       << "  -debug             verbose logging for every subsystem\n"
       << "  -h, --help         show this help\n";
}

config::Config resolveConfig(const CommandLine& cli) {
    config::Config cfg;

    if (cli.configPath) cfg = config::loadConfig(*cli.configPath);
    else if (const auto path = config::defaultConfigPath()) cfg = config::loadConfig(*path);

    if (cli.token) cfg.api.token = *cli.token;
    if (cli.readOnly) cfg.fuse.read_only = true;

    return cfg;
}

}
