#include "fs/Filesystem.hpp"
#include "fs/DirectoryNode.hpp"
#include "fs/Error.hpp"
#include "fs/FileNode.hpp"
#include "config/Config.hpp"
#include "logging/LogRegistry.hpp"

#include <stdexcept>
#include <unistd.h>

using namespace pfs::logging;
using namespace pfs::remote;
using namespace pfs::remote::model;

namespace pfs::fs {

Filesystem::Filesystem(std::shared_ptr<Store> store, const config::Config& cfg)
    : store_(std::move(store)),
      attrTimeout_(cfg.fuse.attr_timeout_seconds),
      entryTimeout_(cfg.fuse.entry_timeout_seconds),
      stagingDir_(cfg.stagingDir()),
      uid_(::getuid()),
      gid_(::getgid()) {
    if (!store_) throw std::invalid_argument("Filesystem requires a store");
}

void Filesystem::mount() {
    try {
        auto rootEntry = store_->get(ROOT_ID);
        rootEntry.is_directory = true;
        root_ = std::make_shared<DirectoryNode>(*this, std::move(rootEntry));
        registry_.setRoot(root_);

        auto info = store_->accountInfo();
        std::scoped_lock lock(accountMutex_);
        account_ = std::move(info);
    } catch (const RemoteError& e) {
        LogRegistry::fs()->error("[Filesystem] Mount failed: {}", e.what());
        throw FsError(Errc::IOFailure, e.what());
    }

    LogRegistry::fs()->info("[Filesystem] Mounted store root, {} bytes available",
                            account().disk.avail);
}

std::shared_ptr<DirectoryNode> Filesystem::root() const {
    if (!root_) throw std::logic_error("Filesystem::root() called before mount()");
    return root_;
}

std::shared_ptr<Node> Filesystem::nodeFor(const Entry& entry) {
    if (auto live = registry_.findById(entry.id); live && live->isDirectory() == entry.is_directory) {
        if (auto* remote = dynamic_cast<RemoteNode*>(live.get())) {
            remote->refresh(entry);
            return live;
        }
    }

    if (entry.is_directory) return std::make_shared<DirectoryNode>(*this, entry);
    return std::make_shared<FileNode>(*this, entry);
}

void Filesystem::renamed(const int64_t id, const int64_t newParentId, const std::string& newName) {
    const auto live = registry_.findById(id);
    auto* remote = dynamic_cast<RemoteNode*>(live.get());
    if (!remote) return;

    auto entry = *remote->snapshot();
    entry.name = newName;
    entry.parent_id = newParentId;
    remote->refresh(std::move(entry));
}

AccountInfo Filesystem::account() const {
    std::scoped_lock lock(accountMutex_);
    return account_;
}

AccountInfo Filesystem::refreshAccount() {
    try {
        auto info = store_->accountInfo();
        std::scoped_lock lock(accountMutex_);
        account_ = info;
        return info;
    } catch (const RemoteError& e) {
        LogRegistry::fs()->warn("[Filesystem] Account refresh failed, serving mount-time snapshot: {}", e.what());
        return account();
    }
}

struct statvfs Filesystem::statfs() const {
    const auto disk = account().disk;

    struct statvfs st{};
    st.f_bsize = BLOCK_SIZE;
    st.f_frsize = BLOCK_SIZE;
    st.f_blocks = static_cast<fsblkcnt_t>(disk.size) / BLOCK_SIZE;
    st.f_bfree = static_cast<fsblkcnt_t>(disk.avail) / BLOCK_SIZE;
    st.f_bavail = st.f_bfree;
    st.f_namemax = NAME_MAX_LEN;
    return st;
}

void Filesystem::setShutdownHook(std::function<void()> hook) {
    std::scoped_lock lock(hookMutex_);
    shutdownHook_ = std::move(hook);
}

void Filesystem::requestShutdown() {
    std::function<void()> hook;
    {
        std::scoped_lock lock(hookMutex_);
        hook = shutdownHook_;
    }
    if (hook) hook();
    else LogRegistry::fs()->warn("[Filesystem] Shutdown requested with no session attached");
}

}
