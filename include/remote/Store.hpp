#pragma once

#include "remote/model/AccountInfo.hpp"
#include "remote/model/Entry.hpp"
#include "remote/model/Transfer.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace pfs::remote {

// Raised for every failed remote call: transport errors, non-2xx answers, malformed payloads.
class RemoteError : public std::runtime_error {
public:
    explicit RemoteError(const std::string& what, const long httpStatus = 0)
        : std::runtime_error(what), httpStatus_(httpStatus) {}

    [[nodiscard]] long httpStatus() const noexcept { return httpStatus_; }

private:
    long httpStatus_;
};

// Forward-only byte source for one ranged download.
class ByteStream {
public:
    virtual ~ByteStream() = default;

    // Copies up to n bytes into dst. Returns 0 once the stream is exhausted.
    virtual std::size_t read(char* dst, std::size_t n) = 0;
};

// Synchronous client for the backing store. Every call blocks until the
// remote answers; failures throw RemoteError.
class Store {
public:
    virtual ~Store() = default;

    virtual std::vector<model::Entry> list(int64_t parentId) = 0;
    virtual model::Entry get(int64_t id) = 0;
    virtual void remove(int64_t id) = 0;
    virtual void rename(int64_t id, const std::string& newName) = 0;
    virtual void move(int64_t newParentId, int64_t id) = 0;
    virtual model::Entry createFolder(const std::string& name, int64_t parentId) = 0;

    // Always creates a new object; the store has no in-place replace.
    virtual model::Entry upload(const std::filesystem::path& source, const std::string& name, int64_t parentId) = 0;

    // Opens [offset, offset + length), or [offset, end) when no length is given.
    virtual std::unique_ptr<ByteStream> downloadRange(int64_t id, int64_t offset,
                                                      std::optional<int64_t> length = std::nullopt) = 0;

    virtual model::AccountInfo accountInfo() = 0;
    virtual std::vector<model::Transfer> listTransfers() = 0;
};

}
