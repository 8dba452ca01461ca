#pragma once

#include "fs/RemoteNode.hpp"

namespace pfs::fs {

class FileNode final : public RemoteNode, public std::enable_shared_from_this<FileNode> {
public:
    using RemoteNode::RemoteNode;

    // Read intent streams from the remote object, write intent stages locally.
    std::unique_ptr<Handle> open(OpenIntent intent) override;

    // Adjusts the reported size only; nothing is sent remotely.
    void truncate(int64_t size) override;

    // Adopts the record returned by a re-upload and carries the inode over to the new id.
    void replaceEntry(remote::model::Entry uploaded);
};

}
