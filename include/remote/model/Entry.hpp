#pragma once

#include <cstdint>
#include <ctime>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace pfs::remote::model {

inline constexpr int64_t ROOT_ID = 0;
inline constexpr auto DIRECTORY_CONTENT_TYPE = "application/x-directory";

// Snapshot of one remote file or folder record as reported by the store.
struct Entry {
    int64_t id{};
    std::string name{};
    int64_t size{0};
    bool is_directory{false};
    int64_t parent_id{ROOT_ID};
    std::time_t created_at{};
    std::string content_type{};

    [[nodiscard]] bool operator==(const Entry& other) const = default;
};

void to_json(nlohmann::json& j, const Entry& entry);
void from_json(const nlohmann::json& j, Entry& entry);

std::vector<Entry> entriesFromJson(const nlohmann::json& j);

}
