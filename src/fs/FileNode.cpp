#include "fs/FileNode.hpp"
#include "fs/Filesystem.hpp"
#include "fs/ReadHandle.hpp"
#include "fs/WriteHandle.hpp"
#include "fs/cache/Registry.hpp"
#include "logging/LogRegistry.hpp"

using namespace pfs::logging;

namespace pfs::fs {

std::unique_ptr<Handle> FileNode::open(const OpenIntent intent) {
    if (intent == OpenIntent::Read) return std::make_unique<ReadHandle>(shared_from_this());
    return std::make_unique<WriteHandle>(shared_from_this());
}

void FileNode::truncate(const int64_t size) {
    auto entry = *snapshot();
    entry.size = size;
    refresh(std::move(entry));
}

void FileNode::replaceEntry(remote::model::Entry uploaded) {
    const auto oldId = id();
    const auto newId = uploaded.id;
    refresh(std::move(uploaded));
    root_.registry().rebind(oldId, newId);
    LogRegistry::fs()->debug("[FileNode] {} re-uploaded as {}", oldId, newId);
}

}
