#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>

namespace pfs::fs {

// Anonymous scratch file under the staging directory. Removed on destruction.
class StagingFile {
public:
    explicit StagingFile(const std::filesystem::path& dir);
    ~StagingFile();

    StagingFile(const StagingFile&) = delete;
    StagingFile& operator=(const StagingFile&) = delete;

    // Positional write; overlapping ranges are overwritten, holes read back as zeros.
    void writeAt(int64_t offset, const char* data, std::size_t size);

    [[nodiscard]] uint64_t size() const;
    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    int fd_ = -1;
};

}
