#pragma once

#include "fs/Node.hpp"
#include "remote/model/Entry.hpp"

#include <memory>
#include <mutex>

namespace pfs::fs {

class Filesystem;

// Node backed by a remote record. The fetched record is held as an immutable
// snapshot that is swapped whole on refresh; readers keep whichever snapshot
// they obtained.
class RemoteNode : public Node {
public:
    RemoteNode(Filesystem& root, remote::model::Entry entry);

    [[nodiscard]] std::shared_ptr<const remote::model::Entry> snapshot() const;
    [[nodiscard]] int64_t id() const { return snapshot()->id; }
    [[nodiscard]] std::optional<int64_t> remoteId() const override { return id(); }

    [[nodiscard]] struct stat attr() const override;
    [[nodiscard]] double attrTimeout() const override;
    [[nodiscard]] double entryTimeout() const override;

    void refresh(remote::model::Entry entry);

    [[nodiscard]] Filesystem& root() const { return root_; }

protected:
    Filesystem& root_;

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const remote::model::Entry> snapshot_;
};

}
