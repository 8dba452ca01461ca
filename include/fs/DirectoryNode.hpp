#pragma once

#include "fs/RemoteNode.hpp"

#include <vector>

namespace pfs::fs {

// Top-level folder every account carries; it may not be removed.
inline constexpr auto TOP_LEVEL_SENTINEL_NAME = "Your Files";

class DirectoryNode final : public RemoteNode {
public:
    using RemoteNode::RemoteNode;

    [[nodiscard]] bool isDirectory() const override { return true; }

    std::shared_ptr<Node> lookup(const std::string& name) override;
    std::vector<DirEntry> readDirAll() override;
    std::shared_ptr<Node> mkdir(const std::string& name) override;
    CreateResult create(const std::string& name) override;
    void remove(const std::string& name) override;
    // Like remove(), but a folder that still has children is refused.
    void rmdir(const std::string& name) override;
    void rename(const std::string& oldName, Node& newDir, const std::string& newName) override;
    std::shared_ptr<Node> symlink(const std::string& name, const std::string& target) override;

private:
    [[nodiscard]] std::vector<remote::model::Entry> children(const char* op) const;
    [[nodiscard]] std::shared_ptr<Node> lookupPseudoFile(const std::string& name);
    void removeChild(const char* op, const std::string& name, bool requireEmpty);
};

}
