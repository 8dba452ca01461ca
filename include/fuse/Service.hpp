#pragma once

#define FUSE_USE_VERSION 35

#include "concurrency/AsyncService.hpp"

#include <filesystem>
#include <mutex>
#include <fuse_lowlevel.h>

namespace pfs::fs {
class Filesystem;
}

namespace pfs::fuse {

struct MountOptions {
    std::filesystem::path mountPoint;
    bool readOnly = false;
    bool allowOther = false;
    bool debug = false;
    unsigned int maxIdleThreads = 10;
};

// Capabilities negotiated at session init: synchronous in-order reads, no writeback cache, 1 MiB transfers.
void configureConnection(fuse_conn_info& conn);

// Owns the kernel session: mounts, runs the multi-threaded loop and unmounts
// when the loop ends (signal, stop() or a .quit lookup).
class Service final : public concurrency::AsyncService {
public:
    Service(fs::Filesystem& filesystem, MountOptions options);
    ~Service() override;

    void stop() override;

    // False when the session could not be created or mounted.
    [[nodiscard]] bool succeeded() const { return !failed_.load(); }

protected:
    void runLoop() override;

private:
    fs::Filesystem& filesystem_;
    MountOptions options_;

    std::mutex sessionMutex_;
    fuse_session* session_{nullptr};

    void requestExit();
};

}
