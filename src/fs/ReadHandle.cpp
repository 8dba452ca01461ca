#include "fs/ReadHandle.hpp"
#include "fs/Error.hpp"
#include "fs/FileNode.hpp"
#include "fs/Filesystem.hpp"
#include "logging/LogRegistry.hpp"

using namespace pfs::logging;

namespace pfs::fs {

ReadHandle::ReadHandle(std::shared_ptr<FileNode> file) : file_(std::move(file)) {}

std::string ReadHandle::read(const int64_t offset, const std::size_t size) {
    std::scoped_lock lock(mutex_);

    const auto entry = file_->snapshot();
    if (offset >= entry->size) return {};

    std::string out(size, '\0');
    std::size_t got = 0;

    try {
        if (!stream_ || offset_ != offset) {
            if (stream_) LogRegistry::fs()->debug("[ReadHandle] {} seek {} -> {}", entry->id, offset_, offset);
            stream_.reset();
            stream_ = file_->root().store().downloadRange(entry->id, offset);
            offset_ = offset;
        }

        while (got < size) {
            const auto n = stream_->read(out.data() + got, size - got);
            if (n == 0) break;
            got += n;
        }
    } catch (const std::exception& e) {
        stream_.reset();
        LogRegistry::fs()->error("[ReadHandle] Read of {} at {} failed: {}", entry->id, offset, e.what());
        throw FsError(Errc::IOFailure, e.what());
    }

    offset_ += static_cast<int64_t>(got);
    out.resize(got);
    return out;
}

void ReadHandle::release() {
    std::scoped_lock lock(mutex_);
    stream_.reset();
    offset_ = 0;
}

}
