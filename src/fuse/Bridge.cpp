#include "fuse/Bridge.hpp"
#include "fs/Error.hpp"
#include "fs/Filesystem.hpp"
#include "fs/Node.hpp"
#include "logging/LogRegistry.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <string>
#include <vector>

using namespace pfs::fs;
using namespace pfs::logging;

namespace pfs::fuse {

namespace {

constexpr fuse_ino_t UNKNOWN_INO = 0xffffffff;

struct OpenFile {
    std::shared_ptr<Node> node;
    std::unique_ptr<Handle> handle;
};

struct DirListing {
    std::vector<DirEntry> entries;
};

Filesystem& filesystem(const fuse_req_t req) {
    return *static_cast<Filesystem*>(fuse_req_userdata(req));
}

OpenFile* openFile(const fuse_file_info* fi) {
    return reinterpret_cast<OpenFile*>(fi->fh);
}

std::shared_ptr<Node> nodeOrReply(const fuse_req_t req, const fuse_ino_t ino, const char* op) {
    auto node = filesystem(req).registry().get(ino);
    if (!node) {
        LogRegistry::fuse()->error("[{}] No node found for inode {}", op, ino);
        fuse_reply_err(req, ENOENT);
    }
    return node;
}

void replyError(const fuse_req_t req, const char* op, const std::exception& ex) {
    if (const auto* err = dynamic_cast<const FsError*>(&ex)) {
        if (err->code() == Errc::NotFound) LogRegistry::fuse()->debug("[{}] {}: {}", op, to_string(err->code()), err->what());
        else LogRegistry::fuse()->warn("[{}] {}: {}", op, to_string(err->code()), err->what());
        fuse_reply_err(req, err->toErrno());
        return;
    }

    LogRegistry::fuse()->error("[{}] Unexpected error: {}", op, ex.what());
    fuse_reply_err(req, EIO);
}

fuse_entry_param entryFor(Filesystem& mounted, std::shared_ptr<Node>& node) {
    fuse_entry_param e{};
    e.ino = mounted.registry().bind(node);
    e.attr = statFromNode(*node, e.ino);
    e.attr_timeout = node->attrTimeout();
    e.entry_timeout = node->entryTimeout();
    return e;
}

void replyEntry(const fuse_req_t req, std::shared_ptr<Node> node) {
    auto& mounted = filesystem(req);
    const auto e = entryFor(mounted, node);

    // The kernel never saw the entry, so it will never forget it
    if (fuse_reply_entry(req, &e) != 0) mounted.registry().forget(e.ino, 1);
}

bool validName(const fuse_req_t req, const char* name) {
    if (name && std::strlen(name) > 0) return true;
    fuse_reply_err(req, EINVAL);
    return false;
}

}

void lookup(const fuse_req_t req, const fuse_ino_t parent, const char* name) {
    LogRegistry::fuse()->debug("[lookup] Called for parent: {}, name: {}", parent, name);
    if (!validName(req, name)) return;

    const auto dir = nodeOrReply(req, parent, "lookup");
    if (!dir) return;

    try {
        replyEntry(req, dir->lookup(name));
    } catch (const std::exception& ex) {
        replyError(req, "lookup", ex);
    }
}

void forget(const fuse_req_t req, const fuse_ino_t ino, const uint64_t nlookup) {
    LogRegistry::fuse()->debug("[forget] Called for inode: {}, nlookup: {}", ino, nlookup);
    filesystem(req).registry().forget(ino, nlookup);
    fuse_reply_none(req);
}

void forget_multi(const fuse_req_t req, const size_t count, fuse_forget_data* forgets) {
    auto& registry = filesystem(req).registry();
    for (size_t i = 0; i < count; ++i) registry.forget(forgets[i].ino, forgets[i].nlookup);
    fuse_reply_none(req);
}

void getattr(const fuse_req_t req, const fuse_ino_t ino, fuse_file_info* fi) {
    LogRegistry::fuse()->debug("[getattr] Called for inode: {}", ino);
    (void)fi;

    const auto node = nodeOrReply(req, ino, "getattr");
    if (!node) return;

    const auto st = statFromNode(*node, ino);
    fuse_reply_attr(req, &st, node->attrTimeout());
}

void setattr(const fuse_req_t req, const fuse_ino_t ino, struct stat* attr, const int to_set, fuse_file_info* fi) {
    LogRegistry::fuse()->debug("[setattr] Called for inode: {}, to_set: {}", ino, to_set);
    (void)fi;

    const auto node = nodeOrReply(req, ino, "setattr");
    if (!node) return;

    // Mode, ownership and times are not stored remotely and are accepted silently
    try {
        if (to_set & FUSE_SET_ATTR_SIZE) node->truncate(attr->st_size);

        const auto st = statFromNode(*node, ino);
        fuse_reply_attr(req, &st, node->attrTimeout());
    } catch (const std::exception& ex) {
        replyError(req, "setattr", ex);
    }
}

void opendir(const fuse_req_t req, const fuse_ino_t ino, fuse_file_info* fi) {
    LogRegistry::fuse()->debug("[opendir] Called for inode: {}", ino);

    const auto node = nodeOrReply(req, ino, "opendir");
    if (!node) return;

    try {
        auto listing = std::make_unique<DirListing>();
        listing->entries = node->readDirAll();
        fi->fh = reinterpret_cast<uint64_t>(listing.get());

        if (fuse_reply_open(req, fi) == 0) listing.release();
    } catch (const std::exception& ex) {
        replyError(req, "opendir", ex);
    }
}

void readdir(const fuse_req_t req, const fuse_ino_t ino, const size_t size, const off_t off, fuse_file_info* fi) {
    LogRegistry::fuse()->debug("[readdir] Called for inode: {}, size: {}, offset: {}", ino, size, off);

    const auto* listing = reinterpret_cast<DirListing*>(fi->fh);
    if (!listing) {
        fuse_reply_err(req, EBADF);
        return;
    }

    std::vector<char> buf(size);
    size_t buf_used = 0;

    auto add_entry = [&](const std::string& name, const struct stat& st, const off_t next_off) {
        const size_t entry_size = fuse_add_direntry(req, nullptr, 0, name.c_str(), &st, next_off);
        if (buf_used + entry_size > size) return false;

        fuse_add_direntry(req, buf.data() + buf_used, entry_size, name.c_str(), &st, next_off);
        buf_used += entry_size;
        return true;
    };

    off_t current_off = 0;

    if (off <= current_off++) {
        struct stat dot{};
        dot.st_ino = ino;
        dot.st_mode = S_IFDIR;
        if (!add_entry(".", dot, current_off)) goto reply;
    }

    if (off <= current_off++) {
        struct stat dotdot{};
        dotdot.st_ino = UNKNOWN_INO;
        dotdot.st_mode = S_IFDIR;
        if (!add_entry("..", dotdot, current_off)) goto reply;
    }

    for (size_t i = 0; i < listing->entries.size(); ++i, ++current_off) {
        if (off > current_off) continue;

        const auto& entry = listing->entries[i];
        struct stat st{};
        st.st_ino = UNKNOWN_INO;
        st.st_mode = entry.is_directory ? S_IFDIR : S_IFREG;

        if (!add_entry(entry.name, st, current_off + 1)) break;
    }

    reply:
        fuse_reply_buf(req, buf.data(), buf_used);
}

void releasedir(const fuse_req_t req, const fuse_ino_t ino, fuse_file_info* fi) {
    LogRegistry::fuse()->debug("[releasedir] Called for inode: {}", ino);
    delete reinterpret_cast<DirListing*>(fi->fh);
    fi->fh = 0;
    fuse_reply_err(req, 0);
}

void mkdir(const fuse_req_t req, const fuse_ino_t parent, const char* name, const mode_t mode) {
    LogRegistry::fuse()->debug("[mkdir] Called for parent: {}, name: {}, mode: {:o}", parent, name, mode);
    if (!validName(req, name)) return;

    const auto dir = nodeOrReply(req, parent, "mkdir");
    if (!dir) return;

    try {
        replyEntry(req, dir->mkdir(name));
    } catch (const std::exception& ex) {
        replyError(req, "mkdir", ex);
    }
}

void create(const fuse_req_t req, const fuse_ino_t parent, const char* name, const mode_t mode, fuse_file_info* fi) {
    LogRegistry::fuse()->debug("[create] Called for parent: {}, name: {}, mode: {:o}", parent, name, mode);
    if (!validName(req, name)) return;

    const auto dir = nodeOrReply(req, parent, "create");
    if (!dir) return;

    try {
        auto [node, handle] = dir->create(name);

        auto& mounted = filesystem(req);
        const auto e = entryFor(mounted, node);

        auto fh = std::make_unique<OpenFile>(OpenFile{node, std::move(handle)});
        fi->fh = reinterpret_cast<uint64_t>(fh.get());
        fi->direct_io = 0;
        fi->keep_cache = 0;

        if (fuse_reply_create(req, &e, fi) == 0) {
            fh.release();
            return;
        }

        fh->handle->release();
        mounted.registry().forget(e.ino, 1);
    } catch (const std::exception& ex) {
        replyError(req, "create", ex);
    }
}

void unlink(const fuse_req_t req, const fuse_ino_t parent, const char* name) {
    LogRegistry::fuse()->debug("[unlink] Called for parent: {}, name: {}", parent, name);
    if (!validName(req, name)) return;

    const auto dir = nodeOrReply(req, parent, "unlink");
    if (!dir) return;

    try {
        dir->remove(name);
        fuse_reply_err(req, 0);
    } catch (const std::exception& ex) {
        replyError(req, "unlink", ex);
    }
}

void rmdir(const fuse_req_t req, const fuse_ino_t parent, const char* name) {
    LogRegistry::fuse()->debug("[rmdir] Called for parent: {}, name: {}", parent, name);
    if (!validName(req, name)) return;

    const auto dir = nodeOrReply(req, parent, "rmdir");
    if (!dir) return;

    try {
        dir->rmdir(name);
        fuse_reply_err(req, 0);
    } catch (const std::exception& ex) {
        replyError(req, "rmdir", ex);
    }
}

void rename(const fuse_req_t req, const fuse_ino_t parent, const char* name,
            const fuse_ino_t newparent, const char* newname, const unsigned int flags) {
    LogRegistry::fuse()->debug("[rename] {}:{} -> {}:{} (flags {})", parent, name, newparent, newname, flags);
    if (!validName(req, name) || !validName(req, newname)) return;

    if (flags & RENAME_EXCHANGE) {
        fuse_reply_err(req, EINVAL);
        return;
    }

    const auto dir = nodeOrReply(req, parent, "rename");
    if (!dir) return;
    const auto newDir = nodeOrReply(req, newparent, "rename");
    if (!newDir) return;

    try {
        if (flags & RENAME_NOREPLACE) {
            bool exists = true;
            try {
                (void)newDir->lookup(newname);
            } catch (const FsError& err) {
                if (err.code() != Errc::NotFound) throw;
                exists = false;
            }
            if (exists) throw FsError(Errc::AlreadyExists, newname);
        }

        dir->rename(name, *newDir, newname);
        fuse_reply_err(req, 0);
    } catch (const std::exception& ex) {
        replyError(req, "rename", ex);
    }
}

void symlink(const fuse_req_t req, const char* link, const fuse_ino_t parent, const char* name) {
    LogRegistry::fuse()->debug("[symlink] Called for parent: {}, name: {}, link: {}", parent, name, link);

    const auto dir = nodeOrReply(req, parent, "symlink");
    if (!dir) return;

    try {
        replyEntry(req, dir->symlink(name, link));
    } catch (const std::exception& ex) {
        replyError(req, "symlink", ex);
    }
}

void open(const fuse_req_t req, const fuse_ino_t ino, fuse_file_info* fi) {
    LogRegistry::fuse()->debug("[open] Called for inode: {}, flags: {:#x}", ino, fi->flags);

    const auto node = nodeOrReply(req, ino, "open");
    if (!node) return;

    const auto intent = (fi->flags & O_ACCMODE) == O_RDONLY ? OpenIntent::Read : OpenIntent::Write;

    try {
        auto fh = std::make_unique<OpenFile>(OpenFile{node, node->open(intent)});
        fi->fh = reinterpret_cast<uint64_t>(fh.get());
        fi->direct_io = fh->handle->directIo() ? 1 : 0;
        fi->keep_cache = 0;

        if (fuse_reply_open(req, fi) == 0) fh.release();
        else fh->handle->release();
    } catch (const std::exception& ex) {
        replyError(req, "open", ex);
    }
}

void read(const fuse_req_t req, const fuse_ino_t ino, const size_t size, const off_t off, fuse_file_info* fi) {
    LogRegistry::fuse()->debug("[read] Called for inode: {}, size: {}, offset: {}", ino, size, off);

    auto* fh = openFile(fi);
    if (!fh) {
        fuse_reply_err(req, EBADF);
        return;
    }

    try {
        const auto data = fh->handle->read(off, size);
        fuse_reply_buf(req, data.data(), data.size());
    } catch (const std::exception& ex) {
        replyError(req, "read", ex);
    }
}

void write(const fuse_req_t req, const fuse_ino_t ino, const char* buf,
           const size_t size, const off_t off, fuse_file_info* fi) {
    LogRegistry::fuse()->debug("[write] Called for inode: {}, size: {}, offset: {}", ino, size, off);

    auto* fh = openFile(fi);
    if (!fh) {
        fuse_reply_err(req, EBADF);
        return;
    }

    try {
        fuse_reply_write(req, fh->handle->write(off, buf, size));
    } catch (const std::exception& ex) {
        replyError(req, "write", ex);
    }
}

void flush(const fuse_req_t req, const fuse_ino_t ino, fuse_file_info* fi) {
    LogRegistry::fuse()->debug("[flush] Called for inode: {}", ino);

    auto* fh = openFile(fi);
    if (!fh) {
        fuse_reply_err(req, EBADF);
        return;
    }

    try {
        fh->handle->flush();
        fuse_reply_err(req, 0);
    } catch (const std::exception& ex) {
        replyError(req, "flush", ex);
    }
}

void release(const fuse_req_t req, const fuse_ino_t ino, fuse_file_info* fi) {
    LogRegistry::fuse()->debug("[release] Called for inode: {}", ino);

    const std::unique_ptr<OpenFile> fh(openFile(fi));
    fi->fh = 0;

    try {
        if (fh) fh->handle->release();
        fuse_reply_err(req, 0);
    } catch (const std::exception& ex) {
        replyError(req, "release", ex);
    }
}

void fsync(const fuse_req_t req, const fuse_ino_t ino, const int datasync, fuse_file_info* fi) {
    LogRegistry::fuse()->debug("[fsync] Called for inode: {}, datasync: {}", ino, datasync);
    (void)fi;

    const auto node = nodeOrReply(req, ino, "fsync");
    if (!node) return;

    try {
        node->fsync();
        fuse_reply_err(req, 0);
    } catch (const std::exception& ex) {
        replyError(req, "fsync", ex);
    }
}

void statfs(const fuse_req_t req, const fuse_ino_t ino) {
    LogRegistry::fuse()->debug("[statfs] Called for inode: {}", ino);

    const auto st = filesystem(req).statfs();
    fuse_reply_statfs(req, &st);
}

void getxattr(const fuse_req_t req, const fuse_ino_t ino, const char* name, const size_t size) {
    LogRegistry::fuse()->debug("[getxattr] Called for inode: {}, name: {}", ino, name);
    if (size == 0) fuse_reply_xattr(req, 0);
    else fuse_reply_buf(req, nullptr, 0);
}

void listxattr(const fuse_req_t req, const fuse_ino_t ino, const size_t size) {
    LogRegistry::fuse()->debug("[listxattr] Called for inode: {}", ino);
    if (size == 0) fuse_reply_xattr(req, 0);
    else fuse_reply_buf(req, nullptr, 0);
}

void setxattr(const fuse_req_t req, const fuse_ino_t ino, const char* name,
              const char* value, const size_t size, const int flags) {
    LogRegistry::fuse()->debug("[setxattr] Called for inode: {}, name: {}", ino, name);
    (void)value; (void)size; (void)flags;
    fuse_reply_err(req, 0);
}

void removexattr(const fuse_req_t req, const fuse_ino_t ino, const char* name) {
    LogRegistry::fuse()->debug("[removexattr] Called for inode: {}, name: {}", ino, name);
    fuse_reply_err(req, 0);
}

fuse_lowlevel_ops getOperations() {
    fuse_lowlevel_ops ops = {};
    ops.lookup = lookup;
    ops.forget = forget;
    ops.forget_multi = forget_multi;
    ops.getattr = getattr;
    ops.setattr = setattr;
    ops.opendir = opendir;
    ops.readdir = readdir;
    ops.releasedir = releasedir;
    ops.mkdir = mkdir;
    ops.create = create;
    ops.unlink = unlink;
    ops.rmdir = rmdir;
    ops.rename = rename;
    ops.symlink = symlink;
    ops.open = open;
    ops.read = read;
    ops.write = write;
    ops.flush = flush;
    ops.release = release;
    ops.fsync = fsync;
    ops.statfs = statfs;
    ops.getxattr = getxattr;
    ops.listxattr = listxattr;
    ops.setxattr = setxattr;
    ops.removexattr = removexattr;
    return ops;
}

struct stat statFromNode(const Node& node, const fuse_ino_t ino) {
    struct stat st = node.attr();
    st.st_ino = ino;
    return st;
}

}
