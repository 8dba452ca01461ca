#include "runtime/CommandLine.hpp"
#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"
#include "remote/PutioClient.hpp"
#include "fs/Filesystem.hpp"
#include "fuse/Service.hpp"

#include <cstdlib>
#include <iostream>

using namespace pfs::config;
using namespace pfs::logging;
using namespace pfs::runtime;

int main(int argc, char** argv) {
    const std::string program = argc > 0 ? argv[0] : "putiofs";

    const auto cli = parseCommandLine(argc, argv);
    if (!cli) {
        printUsage(std::cerr, program);
        return USAGE_EXIT_CODE;
    }

    if (cli->showHelp) {
        printUsage(std::cout, program);
        return EXIT_SUCCESS;
    }

    try {
        auto cfg = resolveConfig(*cli);
        if (cfg.api.token.empty()) {
            std::cerr << "An access token is required (-token or api.token in the config file)\n";
            printUsage(std::cerr, program);
            return USAGE_EXIT_CODE;
        }

        ConfigRegistry::init(cfg);
        LogRegistry::init(ConfigRegistry::get().logging, cli->debug);

        LogRegistry::putiofs()->info("[*] Connecting to put.io...");

        const auto& config = ConfigRegistry::get();
        pfs::fs::Filesystem filesystem(std::make_shared<pfs::remote::PutioClient>(config.api), config);
        filesystem.mount();

        pfs::fuse::Service service(filesystem, {
            .mountPoint = cli->mountPoint,
            .readOnly = config.fuse.read_only,
            .allowOther = config.fuse.allow_other,
            .debug = cli->debug,
            .maxIdleThreads = config.fuse.max_idle_threads,
        });

        service.start();
        service.wait();

        if (!service.succeeded()) {
            LogRegistry::putiofs()->error("[-] Failed to serve {}", cli->mountPoint.string());
            return EXIT_FAILURE;
        }

        LogRegistry::putiofs()->info("[✓] Unmounted cleanly.");
        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        if (LogRegistry::isInitialized()) LogRegistry::putiofs()->error("[-] Failed to start putiofs: {}", e.what());
        else std::cerr << "putiofs: " << e.what() << '\n';
        return EXIT_FAILURE;
    }
}
