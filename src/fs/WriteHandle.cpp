#include "fs/WriteHandle.hpp"
#include "fs/Error.hpp"
#include "fs/FileNode.hpp"
#include "fs/Filesystem.hpp"
#include "logging/LogRegistry.hpp"
#include "remote/Store.hpp"

#include <fmt/format.h>

using namespace pfs::logging;

namespace pfs::fs {

WriteHandle::WriteHandle(std::shared_ptr<FileNode> file)
    : file_(std::move(file)) {
    try {
        staging_ = std::make_unique<StagingFile>(file_->root().stagingDir());
    } catch (const std::exception& e) {
        LogRegistry::fs()->error("[WriteHandle] {}", e.what());
        throw FsError(Errc::IOFailure, e.what());
    }
}

std::size_t WriteHandle::write(const int64_t offset, const char* data, const std::size_t size) {
    std::scoped_lock lock(mutex_);
    if (!staging_) throw FsError(Errc::IOFailure, "write on a released handle");

    try {
        // Staging starts empty; bytes left between it and the write would overwrite remote content with zeros
        const auto staged = static_cast<int64_t>(staging_->size());
        const auto entry = file_->snapshot();
        if (offset > staged && staged < entry->size)
            throw FsError(Errc::NotSupported,
                          fmt::format("partial write at {} into {} ({} of {} bytes staged)",
                                      offset, entry->name, staged, entry->size));

        staging_->writeAt(offset, data, size);
    } catch (const FsError& e) {
        LogRegistry::fs()->warn("[WriteHandle] {}", e.what());
        throw;
    } catch (const std::exception& e) {
        LogRegistry::fs()->error("[WriteHandle] {}", e.what());
        throw FsError(Errc::IOFailure, e.what());
    }

    dirty_ = true;
    return size;
}

void WriteHandle::flush() {
    std::scoped_lock lock(mutex_);
    if (!dirty_ || !staging_) return;

    const auto entry = file_->snapshot();
    auto& store = file_->root().store();

    try {
        // Upload always creates a new object, so the old one goes first
        if (!remoteRemoved_) {
            try {
                store.remove(entry->id);
            } catch (const remote::RemoteError& e) {
                if (e.httpStatus() != 404) throw;
                LogRegistry::fs()->warn("[WriteHandle] {} ({}) already gone remotely", entry->name, entry->id);
            }
            remoteRemoved_ = true;
        }
        auto uploaded = store.upload(staging_->path(), entry->name, entry->parent_id);
        LogRegistry::fs()->debug("[WriteHandle] Flushed {} ({} bytes)", entry->name, uploaded.size);
        file_->replaceEntry(std::move(uploaded));
        remoteRemoved_ = false;
    } catch (const std::exception& e) {
        LogRegistry::fs()->error("[WriteHandle] Flush of {} ({}) failed: {}", entry->name, entry->id, e.what());
        throw FsError(Errc::IOFailure, e.what());
    }

    dirty_ = false;
}

void WriteHandle::release() {
    std::scoped_lock lock(mutex_);
    if (dirty_) {
        const auto entry = file_->snapshot();
        if (remoteRemoved_)
            LogRegistry::fs()->error("[WriteHandle] {} ({}) was deleted remotely and never re-uploaded", entry->name, entry->id);
        else
            LogRegistry::fs()->debug("[WriteHandle] Discarding unflushed content of {}", entry->name);
    }
    staging_.reset();
    dirty_ = false;
}

bool WriteHandle::dirty() const {
    std::scoped_lock lock(mutex_);
    return dirty_;
}

}
