#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <sys/stat.h>

namespace pfs::fs {

class Handle;

struct DirEntry {
    std::string name;
    bool is_directory{false};
};

enum class OpenIntent { Read, Write };

struct CreateResult;

// One mounted filesystem object. Every capability defaults to NotSupported;
// concrete nodes override what they offer.
class Node {
public:
    virtual ~Node() = default;

    [[nodiscard]] virtual struct stat attr() const = 0;
    [[nodiscard]] virtual bool isDirectory() const { return false; }

    // Remote id backing this node, if any. Pseudo-files have none.
    [[nodiscard]] virtual std::optional<int64_t> remoteId() const { return std::nullopt; }

    [[nodiscard]] virtual double attrTimeout() const { return 0.0; }
    [[nodiscard]] virtual double entryTimeout() const { return 0.0; }

    virtual std::shared_ptr<Node> lookup(const std::string& name);
    virtual std::vector<DirEntry> readDirAll();
    virtual std::shared_ptr<Node> mkdir(const std::string& name);
    virtual CreateResult create(const std::string& name);
    virtual void remove(const std::string& name);
    virtual void rmdir(const std::string& name);
    virtual void rename(const std::string& oldName, Node& newDir, const std::string& newName);
    virtual std::shared_ptr<Node> symlink(const std::string& name, const std::string& target);

    virtual std::unique_ptr<Handle> open(OpenIntent intent);
    virtual void truncate(int64_t size);
    virtual void fsync();
};

// Per-open state. Calls on a single handle are serialized by the handle itself.
class Handle {
public:
    virtual ~Handle() = default;

    virtual std::string read(int64_t offset, std::size_t size);
    virtual std::size_t write(int64_t offset, const char* data, std::size_t size);
    virtual void flush() {}
    virtual void release() {}

    // Content is generated on open and must bypass the page cache.
    [[nodiscard]] virtual bool directIo() const { return false; }
};

struct CreateResult {
    std::shared_ptr<Node> node;
    std::unique_ptr<Handle> handle;
};

}
