#pragma once

#include "fs/cache/Registry.hpp"
#include "remote/Store.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <sys/statvfs.h>
#include <sys/types.h>

namespace pfs::config {
struct Config;
}

namespace pfs::fs {

class DirectoryNode;
class Node;

// Mount-scoped state: the store, the root directory, the inode registry and
// the account snapshot (fetched at mount, refreshed when .account is looked up).
class Filesystem {
public:
    static constexpr unsigned long BLOCK_SIZE = 4096;
    static constexpr unsigned long NAME_MAX_LEN = 255;

    Filesystem(std::shared_ptr<remote::Store> store, const config::Config& cfg);

    // Resolves the store root and takes the first account snapshot. Throws FsError.
    void mount();

    [[nodiscard]] std::shared_ptr<DirectoryNode> root() const;
    [[nodiscard]] remote::Store& store() const { return *store_; }
    [[nodiscard]] cache::Registry& registry() { return registry_; }

    // Live node for the record's id if the kernel still references one, else a new node.
    std::shared_ptr<Node> nodeFor(const remote::model::Entry& entry);

    // Carries a completed rename into the live node for id, if any.
    void renamed(int64_t id, int64_t newParentId, const std::string& newName);

    [[nodiscard]] remote::model::AccountInfo account() const;

    // Falls back to the last good snapshot when the store cannot be reached.
    remote::model::AccountInfo refreshAccount();

    [[nodiscard]] struct statvfs statfs() const;

    [[nodiscard]] double attrTimeout() const { return attrTimeout_; }
    [[nodiscard]] double entryTimeout() const { return entryTimeout_; }
    [[nodiscard]] const std::filesystem::path& stagingDir() const { return stagingDir_; }
    [[nodiscard]] uid_t uid() const { return uid_; }
    [[nodiscard]] gid_t gid() const { return gid_; }

    void setShutdownHook(std::function<void()> hook);
    void requestShutdown();

private:
    std::shared_ptr<remote::Store> store_;
    cache::Registry registry_;
    std::shared_ptr<DirectoryNode> root_;

    mutable std::mutex accountMutex_;
    remote::model::AccountInfo account_;

    std::mutex hookMutex_;
    std::function<void()> shutdownHook_;

    double attrTimeout_;
    double entryTimeout_;
    std::filesystem::path stagingDir_;
    uid_t uid_;
    gid_t gid_;
};

}
