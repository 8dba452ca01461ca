#include "fs/StagingFile.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace pfs::fs {

namespace {
std::runtime_error sysError(const std::string& what) {
    return std::runtime_error(what + ": " + std::strerror(errno));
}
}

StagingFile::StagingFile(const std::filesystem::path& dir) {
    std::string tmpl = (dir / "putiofs-XXXXXX").string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    fd_ = ::mkstemp(buf.data());
    if (fd_ < 0) throw sysError("Failed to create staging file in " + dir.string());
    path_ = buf.data();
}

StagingFile::~StagingFile() {
    if (fd_ >= 0) ::close(fd_);
    if (!path_.empty()) ::unlink(path_.c_str());
}

void StagingFile::writeAt(int64_t offset, const char* data, std::size_t size) {
    while (size > 0) {
        const ssize_t n = ::pwrite(fd_, data, size, static_cast<off_t>(offset));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw sysError("Failed to write staging file " + path_.string());
        }
        data += n;
        size -= static_cast<std::size_t>(n);
        offset += n;
    }
}

uint64_t StagingFile::size() const {
    struct stat st{};
    if (::fstat(fd_, &st) < 0) throw sysError("Failed to stat staging file " + path_.string());
    return static_cast<uint64_t>(st.st_size);
}

}
