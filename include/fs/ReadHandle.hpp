#pragma once

#include "fs/Node.hpp"
#include "remote/Store.hpp"

#include <memory>
#include <mutex>

namespace pfs::fs {

class FileNode;

// Streaming reader. Sequential reads share one open ranged download; a read
// at any other offset drops it and reopens at the requested offset.
class ReadHandle final : public Handle {
public:
    explicit ReadHandle(std::shared_ptr<FileNode> file);

    std::string read(int64_t offset, std::size_t size) override;
    void release() override;

private:
    std::shared_ptr<FileNode> file_;
    std::mutex mutex_;
    int64_t offset_ = 0;
    std::unique_ptr<remote::ByteStream> stream_;
};

}
