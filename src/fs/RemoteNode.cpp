#include "fs/RemoteNode.hpp"
#include "fs/Filesystem.hpp"

namespace pfs::fs {

RemoteNode::RemoteNode(Filesystem& root, remote::model::Entry entry)
    : root_(root), snapshot_(std::make_shared<const remote::model::Entry>(std::move(entry))) {}

std::shared_ptr<const remote::model::Entry> RemoteNode::snapshot() const {
    std::scoped_lock lock(mutex_);
    return snapshot_;
}

void RemoteNode::refresh(remote::model::Entry entry) {
    auto next = std::make_shared<const remote::model::Entry>(std::move(entry));
    std::scoped_lock lock(mutex_);
    snapshot_ = std::move(next);
}

struct stat RemoteNode::attr() const {
    const auto entry = snapshot();

    struct stat st{};
    st.st_mode = entry->is_directory ? S_IFDIR | 0755 : S_IFREG | 0644;
    st.st_size = static_cast<off_t>(entry->size);
    st.st_nlink = 1;
    st.st_uid = root_.uid();
    st.st_gid = root_.gid();
    st.st_blksize = Filesystem::BLOCK_SIZE;
    st.st_blocks = (st.st_size + 511) / 512;

    // No modification time is tracked remotely
    st.st_mtim.tv_sec = entry->created_at;
    st.st_atim = st.st_ctim = st.st_mtim;
    return st;
}

double RemoteNode::attrTimeout() const { return root_.attrTimeout(); }

double RemoteNode::entryTimeout() const { return root_.entryTimeout(); }

}
