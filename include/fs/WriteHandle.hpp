#pragma once

#include "fs/Node.hpp"
#include "fs/StagingFile.hpp"

#include <memory>
#include <mutex>

namespace pfs::fs {

class FileNode;

// Accumulates writes in a local staging file and replaces the remote object on flush.
// Content still unflushed at release is discarded. Writes may not leave a hole over
// remote bytes that were never staged; truncate to zero first to rewrite from scratch.
class WriteHandle final : public Handle {
public:
    explicit WriteHandle(std::shared_ptr<FileNode> file);

    std::size_t write(int64_t offset, const char* data, std::size_t size) override;
    void flush() override;
    void release() override;

    [[nodiscard]] bool dirty() const;

private:
    std::shared_ptr<FileNode> file_;
    mutable std::mutex mutex_;
    std::unique_ptr<StagingFile> staging_;
    bool dirty_ = false;
    bool remoteRemoved_ = false;  // old object deleted, upload still pending
};

}
