#include "fs/cache/Registry.hpp"
#include "fs/Node.hpp"
#include "logging/LogRegistry.hpp"

#include <mutex>
#include <stdexcept>

using namespace pfs::logging;

namespace pfs::fs::cache {

void Registry::setRoot(const std::shared_ptr<Node>& root) {
    if (!root) throw std::invalid_argument("Registry root must not be null");

    std::unique_lock lock(mutex_);
    inodes_[FUSE_ROOT_ID] = Slot{root, 1};
    if (const auto id = root->remoteId()) idToInode_[*id] = FUSE_ROOT_ID;
}

fuse_ino_t Registry::bind(std::shared_ptr<Node>& node) {
    if (!node) throw std::invalid_argument("Cannot bind a null node");

    std::unique_lock lock(mutex_);

    const auto id = node->remoteId();
    if (id) {
        if (const auto it = idToInode_.find(*id); it != idToInode_.end()) {
            auto& slot = inodes_.at(it->second);
            node = slot.node;
            ++slot.lookups;
            return it->second;
        }
    }

    const auto ino = nextInode_++;
    inodes_[ino] = Slot{node, 1};
    if (id) idToInode_[*id] = ino;

    LogRegistry::fuse()->debug("[Registry] Bound inode {} (remote id {})", ino, id ? *id : -1);
    return ino;
}

std::shared_ptr<Node> Registry::get(const fuse_ino_t ino) const {
    std::shared_lock lock(mutex_);
    if (const auto it = inodes_.find(ino); it != inodes_.end()) return it->second.node;
    return nullptr;
}

std::shared_ptr<Node> Registry::findById(const int64_t id) const {
    std::shared_lock lock(mutex_);
    const auto it = idToInode_.find(id);
    if (it == idToInode_.end()) return nullptr;
    return inodes_.at(it->second).node;
}

void Registry::forget(const fuse_ino_t ino, const uint64_t nlookup) {
    if (ino == FUSE_ROOT_ID) return;

    std::unique_lock lock(mutex_);
    const auto it = inodes_.find(ino);
    if (it == inodes_.end()) return;

    auto& slot = it->second;
    slot.lookups = nlookup >= slot.lookups ? 0 : slot.lookups - nlookup;
    if (slot.lookups > 0) return;

    if (const auto id = slot.node->remoteId()) {
        if (const auto idIt = idToInode_.find(*id); idIt != idToInode_.end() && idIt->second == ino)
            idToInode_.erase(idIt);
    }
    inodes_.erase(it);
}

void Registry::rebind(const int64_t oldId, const int64_t newId) {
    std::unique_lock lock(mutex_);
    const auto it = idToInode_.find(oldId);
    if (it == idToInode_.end()) return;

    const auto ino = it->second;
    idToInode_.erase(it);
    idToInode_[newId] = ino;
}

std::size_t Registry::size() const {
    std::shared_lock lock(mutex_);
    return inodes_.size();
}

}
