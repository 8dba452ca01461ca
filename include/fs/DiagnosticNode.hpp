#pragma once

#include "fs/Node.hpp"
#include "remote/model/Entry.hpp"
#include "remote/model/Transfer.hpp"

#include <ctime>
#include <sys/types.h>
#include <string>
#include <vector>

namespace pfs::fs {

class Filesystem;

inline constexpr auto ACCOUNT_FILE_NAME = ".account";
inline constexpr auto TRANSFERS_FILE_NAME = ".transfers";
inline constexpr auto STAT_FILE_NAME = ".stat";
inline constexpr auto QUIT_FILE_NAME = ".quit";

// Read-only pseudo-file whose content is fixed when it is looked up.
class DiagnosticNode final : public Node {
public:
    DiagnosticNode(std::string content, uid_t uid, gid_t gid);

    static std::shared_ptr<DiagnosticNode> account(Filesystem& root);
    static std::shared_ptr<DiagnosticNode> transfers(Filesystem& root);
    static std::shared_ptr<DiagnosticNode> directoryStat(Filesystem& root, int64_t directoryId);

    [[nodiscard]] struct stat attr() const override;
    std::unique_ptr<Handle> open(OpenIntent intent) override;

    [[nodiscard]] const std::string& content() const { return content_; }

private:
    const std::string content_;
    const uid_t uid_;
    const gid_t gid_;
    const std::time_t createdAt_;
};

// Tab-aligned Name/Status/down/up table, or "No transfer found".
std::string formatTransfers(const std::vector<remote::model::Transfer>& transfers);

}
