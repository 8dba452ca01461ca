#include "fuse/Service.hpp"
#include "fuse/Bridge.hpp"
#include "fs/Filesystem.hpp"
#include "logging/LogRegistry.hpp"

#include <cstring>
#include <memory>
#include <string>
#include <vector>

using namespace pfs::fuse;
using namespace pfs::logging;

namespace {

constexpr uintmax_t MB = 1024 * 1024;

void fuse_ll_init(void* userdata, fuse_conn_info* conn) {
    (void)userdata;
    LogRegistry::fuse()->debug("[FUSE] Initializing FUSE connection...");
    configureConnection(*conn);
    LogRegistry::fuse()->debug("[FUSE] Connection initialized with max_readahead={} bytes, max_write={} bytes",
                               conn->max_readahead, conn->max_write);
}

}

void pfs::fuse::configureConnection(fuse_conn_info& conn) {
    // Reads reach a handle in order so its ranged stream can be reused.
    // Writeback caching stays off; write handles cannot serve reads.
    conn.want &= ~FUSE_CAP_ASYNC_READ;
    conn.want &= ~FUSE_CAP_WRITEBACK_CACHE;
    conn.max_readahead = MB;
    conn.max_write = MB;
}

Service::Service(fs::Filesystem& filesystem, MountOptions options)
    : AsyncService("FUSE"), filesystem_(filesystem), options_(std::move(options)) {}

Service::~Service() {
    stop();
}

void Service::requestExit() {
    std::scoped_lock lock(sessionMutex_);
    if (session_) fuse_session_exit(session_);
}

void Service::stop() {
    if (!isRunning()) return;
    LogRegistry::fuse()->info("[FUSE] Stopping FUSE connection...");
    interruptFlag_.store(true);

    requestExit();

    if (worker_.joinable() && std::this_thread::get_id() != worker_.get_id())
        worker_.join();

    running_.store(false);
    interruptFlag_.store(false);
    LogRegistry::fuse()->info("[FUSE] FUSE service stopped");
}

void Service::runLoop() {
    LogRegistry::fuse()->debug("[FUSE] Running FUSE service");

    std::vector<std::string> argsStr = {"putiofs", "-o", "fsname=putiofs", "-o", "subtype=putiofs"};
    if (options_.readOnly) argsStr.insert(argsStr.end(), {"-o", "ro"});
    if (options_.allowOther) argsStr.insert(argsStr.end(), {"-o", "allow_other"});
    if (options_.debug) argsStr.emplace_back("-d");

    std::vector<std::unique_ptr<char[]>> ownedCStrs;
    std::vector<char*> argsCStr;
    for (const auto& str : argsStr) {
        auto buf = std::make_unique<char[]>(str.size() + 1);
        std::memcpy(buf.get(), str.c_str(), str.size() + 1);
        argsCStr.push_back(buf.get());
        ownedCStrs.push_back(std::move(buf));
    }

    fuse_args args = FUSE_ARGS_INIT(static_cast<int>(argsCStr.size()), argsCStr.data());

    fuse_lowlevel_ops ops = getOperations();
    ops.init = fuse_ll_init;

    fuse_session* session = fuse_session_new(&args, &ops, sizeof(ops), &filesystem_);
    if (!session) {
        LogRegistry::fuse()->error("[FUSE] Failed to create FUSE session");
        failed_.store(true);
        fuse_opt_free_args(&args);
        return;
    }

    if (fuse_set_signal_handlers(session) != 0) {
        LogRegistry::fuse()->error("[FUSE] Failed to set signal handlers");
        failed_.store(true);
        fuse_session_destroy(session);
        fuse_opt_free_args(&args);
        return;
    }

    const auto mountPoint = options_.mountPoint.string();
    if (fuse_session_mount(session, mountPoint.c_str()) != 0) {
        LogRegistry::fuse()->error("[FUSE] Failed to mount FUSE filesystem at {}", mountPoint);
        failed_.store(true);
        fuse_remove_signal_handlers(session);
        fuse_session_destroy(session);
        fuse_opt_free_args(&args);
        return;
    }

    {
        std::scoped_lock lock(sessionMutex_);
        session_ = session;
    }
    filesystem_.setShutdownHook([this] { requestExit(); });

    LogRegistry::fuse()->info("[FUSE] Mounted FUSE filesystem at {}", mountPoint);

    fuse_loop_config cfg{};
    cfg.clone_fd = 0;
    cfg.max_idle_threads = options_.maxIdleThreads;

    if (const int res = fuse_session_loop_mt(session, &cfg); res != 0)
        LogRegistry::fuse()->info("[FUSE] Session loop ended with status {}", res);

    LogRegistry::fuse()->info("[FUSE] FUSE service loop exiting");

    filesystem_.setShutdownHook(nullptr);
    {
        std::scoped_lock lock(sessionMutex_);
        session_ = nullptr;
    }

    fuse_session_unmount(session);
    fuse_remove_signal_handlers(session);
    fuse_session_destroy(session);
    fuse_opt_free_args(&args);

    LogRegistry::fuse()->info("[FUSE] Unmounted {}", mountPoint);
}
