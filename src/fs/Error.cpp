#include "fs/Error.hpp"

#include <cerrno>

namespace pfs::fs {

const char* to_string(const Errc code) {
    switch (code) {
        case Errc::NotFound: return "not found";
        case Errc::AlreadyExists: return "already exists";
        case Errc::IOFailure: return "I/O failure";
        case Errc::NotSupported: return "not supported";
        case Errc::InvalidRequest: return "invalid request";
        case Errc::NotEmpty: return "directory not empty";
    }
    return "unknown";
}

FsError::FsError(const Errc code, const std::string& what)
    : std::runtime_error(what), code_(code) {}

int FsError::toErrno() const noexcept {
    switch (code_) {
        case Errc::NotFound: return ENOENT;
        case Errc::AlreadyExists: return EEXIST;
        case Errc::IOFailure: return EIO;
        case Errc::NotSupported: return ENOTSUP;
        case Errc::InvalidRequest: return EINVAL;
        case Errc::NotEmpty: return ENOTEMPTY;
    }
    return EIO;
}

}
