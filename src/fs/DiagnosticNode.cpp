#include "fs/DiagnosticNode.hpp"
#include "fs/Error.hpp"
#include "fs/Filesystem.hpp"
#include "util/humanize.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <array>
#include <nlohmann/json.hpp>
#include <fmt/format.h>

using namespace pfs::logging;
using namespace pfs::remote;

namespace pfs::fs {

namespace {

class BufferHandle final : public Handle {
public:
    explicit BufferHandle(const std::string& content) : content_(content) {}

    std::string read(const int64_t offset, const std::size_t size) override {
        if (offset < 0 || static_cast<std::size_t>(offset) >= content_.size()) return {};
        return content_.substr(static_cast<std::size_t>(offset), size);
    }

    [[nodiscard]] bool directIo() const override { return true; }

private:
    std::string content_;
};

// Width in code points; the table carries multi-byte arrows and check marks
std::size_t displayWidth(const std::string& s) {
    return static_cast<std::size_t>(std::count_if(s.begin(), s.end(), [](const char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

constexpr std::size_t TABLE_PADDING = 3;

}

DiagnosticNode::DiagnosticNode(std::string content, const uid_t uid, const gid_t gid)
    : content_(std::move(content)), uid_(uid), gid_(gid), createdAt_(std::time(nullptr)) {}

std::shared_ptr<DiagnosticNode> DiagnosticNode::account(Filesystem& root) {
    const auto info = root.refreshAccount();
    return std::make_shared<DiagnosticNode>(nlohmann::json(info).dump(2) + "\n", root.uid(), root.gid());
}

std::shared_ptr<DiagnosticNode> DiagnosticNode::transfers(Filesystem& root) {
    try {
        const auto list = root.store().listTransfers();
        return std::make_shared<DiagnosticNode>(formatTransfers(list), root.uid(), root.gid());
    } catch (const RemoteError& e) {
        LogRegistry::fs()->error("[DiagnosticNode] Listing transfers failed: {}", e.what());
        throw FsError(Errc::IOFailure, e.what());
    }
}

std::shared_ptr<DiagnosticNode> DiagnosticNode::directoryStat(Filesystem& root, const int64_t directoryId) {
    try {
        const auto entry = root.store().get(directoryId);
        return std::make_shared<DiagnosticNode>(nlohmann::json(entry).dump(2) + "\n", root.uid(), root.gid());
    } catch (const RemoteError& e) {
        LogRegistry::fs()->error("[DiagnosticNode] Fetching {} failed: {}", directoryId, e.what());
        throw FsError(Errc::IOFailure, e.what());
    }
}

struct stat DiagnosticNode::attr() const {
    struct stat st{};
    st.st_mode = S_IFREG | 0400;
    st.st_size = static_cast<off_t>(content_.size());
    st.st_nlink = 1;
    st.st_uid = uid_;
    st.st_gid = gid_;
    st.st_mtim.tv_sec = createdAt_;
    st.st_atim = st.st_ctim = st.st_mtim;
    return st;
}

std::unique_ptr<Handle> DiagnosticNode::open(const OpenIntent intent) {
    if (intent != OpenIntent::Read) throw FsError(Errc::NotSupported, "pseudo-files are read-only");
    return std::make_unique<BufferHandle>(content_);
}

std::string formatTransfers(const std::vector<model::Transfer>& transfers) {
    if (transfers.empty()) return "No transfer found\n";

    std::vector<std::array<std::string, 4>> rows;
    rows.push_back({"Name", "Status", "▼", "▲"});
    rows.push_back({"----", "------", "-", "-"});

    for (const auto& t : transfers) {
        if (t.isCompleted()) {
            rows.push_back({t.name, "✓", "", ""});
            continue;
        }

        const auto dl = util::humanizeBytes(static_cast<uint64_t>(std::max<int64_t>(t.downloaded, 0)));
        const auto sz = util::humanizeBytes(static_cast<uint64_t>(std::max<int64_t>(t.size, 0)));
        rows.push_back({
            t.name,
            fmt::format("{}/{}", dl, sz),
            util::humanizeBytes(static_cast<uint64_t>(std::max<int64_t>(t.down_speed, 0))) + "/s",
            util::humanizeBytes(static_cast<uint64_t>(std::max<int64_t>(t.up_speed, 0))) + "/s",
        });
    }

    std::array<std::size_t, 4> widths{};
    for (const auto& row : rows)
        for (std::size_t i = 0; i < row.size(); ++i)
            widths[i] = std::max(widths[i], displayWidth(row[i]));

    std::string out;
    for (const auto& row : rows) {
        for (std::size_t i = 0; i < row.size(); ++i) {
            out += row[i];
            out.append(widths[i] - displayWidth(row[i]) + TABLE_PADDING, ' ');
        }
        out += '\n';
    }
    return out;
}

}
