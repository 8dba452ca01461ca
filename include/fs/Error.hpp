#pragma once

#include <stdexcept>
#include <string>

namespace pfs::fs {

enum class Errc {
    NotFound,        // name absent from the remote listing
    AlreadyExists,   // mkdir/create name collision
    IOFailure,       // a remote call failed
    NotSupported,    // symlink, fsync, partial rewrites, operations a node does not offer
    InvalidRequest,  // removal of the root or the top-level sentinel
    NotEmpty         // rmdir of a folder that still has children
};

[[nodiscard]] const char* to_string(Errc code);

class FsError : public std::runtime_error {
public:
    FsError(Errc code, const std::string& what);

    [[nodiscard]] Errc code() const noexcept { return code_; }

    // Kernel errno for this error.
    [[nodiscard]] int toErrno() const noexcept;

private:
    Errc code_;
};

}
