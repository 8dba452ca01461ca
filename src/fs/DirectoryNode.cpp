#include "fs/DirectoryNode.hpp"
#include "fs/DiagnosticNode.hpp"
#include "fs/Error.hpp"
#include "fs/FileNode.hpp"
#include "fs/Filesystem.hpp"
#include "fs/JunkFilter.hpp"
#include "fs/StagingFile.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>

using namespace pfs::logging;
using namespace pfs::remote;
using namespace pfs::remote::model;

namespace pfs::fs {

namespace {

const Entry* findByName(const std::vector<Entry>& entries, const std::string& name) {
    const auto it = std::find_if(entries.begin(), entries.end(),
                                 [&](const Entry& e) { return e.name == name; });
    return it == entries.end() ? nullptr : &*it;
}

FsError remoteFailure(const char* op, const std::string& name, const RemoteError& e) {
    LogRegistry::fs()->error("[{}] {}: {}", op, name, e.what());
    return {Errc::IOFailure, e.what()};
}

}

std::vector<Entry> DirectoryNode::children(const char* op) const {
    const auto self = snapshot();
    try {
        return root_.store().list(self->id);
    } catch (const RemoteError& e) {
        throw remoteFailure(op, self->name, e);
    }
}

std::shared_ptr<Node> DirectoryNode::lookupPseudoFile(const std::string& name) {
    if (name == ACCOUNT_FILE_NAME) return DiagnosticNode::account(root_);
    if (name == TRANSFERS_FILE_NAME) return DiagnosticNode::transfers(root_);
    if (name == STAT_FILE_NAME) return DiagnosticNode::directoryStat(root_, id());
    if (name == QUIT_FILE_NAME) {
        LogRegistry::fs()->info("[lookup] Unmount requested through {}", QUIT_FILE_NAME);
        root_.requestShutdown();
        throw FsError(Errc::NotFound, name);
    }
    return nullptr;
}

std::shared_ptr<Node> DirectoryNode::lookup(const std::string& name) {
    if (isJunkName(name)) throw FsError(Errc::NotFound, name);

    if (auto pseudo = lookupPseudoFile(name)) return pseudo;

    const auto entries = children("lookup");
    const auto* match = findByName(entries, name);
    if (!match) throw FsError(Errc::NotFound, name);

    return root_.nodeFor(*match);
}

std::vector<DirEntry> DirectoryNode::readDirAll() {
    const auto entries = children("readdir");

    std::vector<DirEntry> out;
    out.reserve(entries.size());
    for (const auto& e : entries) out.push_back({e.name, e.is_directory});
    return out;
}

std::shared_ptr<Node> DirectoryNode::mkdir(const std::string& name) {
    if (findByName(children("mkdir"), name)) throw FsError(Errc::AlreadyExists, name);

    try {
        return root_.nodeFor(root_.store().createFolder(name, id()));
    } catch (const RemoteError& e) {
        throw remoteFailure("mkdir", name, e);
    }
}

CreateResult DirectoryNode::create(const std::string& name) {
    if (findByName(children("create"), name)) throw FsError(Errc::AlreadyExists, name);

    Entry placeholder;
    try {
        const StagingFile empty(root_.stagingDir());
        placeholder = root_.store().upload(empty.path(), name, id());
    } catch (const RemoteError& e) {
        throw remoteFailure("create", name, e);
    } catch (const std::runtime_error& e) {
        LogRegistry::fs()->error("[create] {}: {}", name, e.what());
        throw FsError(Errc::IOFailure, e.what());
    }

    auto node = root_.nodeFor(placeholder);
    auto handle = node->open(OpenIntent::Write);
    return {std::move(node), std::move(handle)};
}

void DirectoryNode::remove(const std::string& name) {
    removeChild("remove", name, false);
}

void DirectoryNode::rmdir(const std::string& name) {
    removeChild("rmdir", name, true);
}

void DirectoryNode::removeChild(const char* op, const std::string& name, const bool requireEmpty) {
    if (name == "/" || name == TOP_LEVEL_SENTINEL_NAME)
        throw FsError(Errc::InvalidRequest, "refusing to remove " + name);

    const auto entries = children(op);
    const auto* match = findByName(entries, name);
    if (!match) throw FsError(Errc::NotFound, name);

    try {
        // Deleting a folder remotely takes its whole subtree with it
        if (requireEmpty && match->is_directory && !root_.store().list(match->id).empty())
            throw FsError(Errc::NotEmpty, name);
        root_.store().remove(match->id);
    } catch (const RemoteError& e) {
        throw remoteFailure(op, name, e);
    }
}

void DirectoryNode::rename(const std::string& oldName, Node& newDir, const std::string& newName) {
    auto* target = dynamic_cast<DirectoryNode*>(&newDir);
    if (!target) throw FsError(Errc::IOFailure, "rename target is not a directory");

    const bool sameDir = target->id() == id();
    if (sameDir && oldName == newName) return;

    const auto entries = children("rename");
    const auto* match = findByName(entries, oldName);
    if (!match) throw FsError(Errc::NotFound, oldName);

    const auto fileId = match->id;
    auto& store = root_.store();

    try {
        if (sameDir) {
            store.rename(fileId, newName);
        } else {
            // Move first so the new directory never briefly holds the old name
            store.move(target->id(), fileId);
            if (oldName != newName) store.rename(fileId, newName);
        }
    } catch (const RemoteError& e) {
        throw remoteFailure("rename", oldName, e);
    }

    root_.renamed(fileId, target->id(), newName);
}

std::shared_ptr<Node> DirectoryNode::symlink(const std::string& name, const std::string&) {
    throw FsError(Errc::NotSupported, "symlinks are not supported: " + name);
}

}
