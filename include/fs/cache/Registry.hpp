#pragma once

#define FUSE_USE_VERSION 35

#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <unordered_map>
#include <fuse_lowlevel.h>

namespace pfs::fs {
class Node;
}

namespace pfs::fs::cache {

// Kernel inode <-> live node table. A remote id keeps a single inode and node
// object while the kernel holds lookups on it; nodes without a remote id get
// a fresh inode each time they are bound.
class Registry {
public:
    Registry() = default;

    void setRoot(const std::shared_ptr<Node>& root);

    // Counts one kernel lookup. When the id is already bound, node is replaced
    // with the bound object so callers reply with the canonical node.
    fuse_ino_t bind(std::shared_ptr<Node>& node);

    [[nodiscard]] std::shared_ptr<Node> get(fuse_ino_t ino) const;
    [[nodiscard]] std::shared_ptr<Node> findById(int64_t id) const;

    void forget(fuse_ino_t ino, uint64_t nlookup);

    // Moves the inode bound to oldId over to newId.
    void rebind(int64_t oldId, int64_t newId);

    [[nodiscard]] std::size_t size() const;

private:
    struct Slot {
        std::shared_ptr<Node> node;
        uint64_t lookups = 0;
    };

    mutable std::shared_mutex mutex_;
    fuse_ino_t nextInode_ = FUSE_ROOT_ID + 1;
    std::unordered_map<fuse_ino_t, Slot> inodes_;
    std::unordered_map<int64_t, fuse_ino_t> idToInode_;
};

}
