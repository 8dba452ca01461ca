#include "remote/model/Entry.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

using namespace pfs::util;

namespace pfs::remote::model {

void to_json(nlohmann::json& j, const Entry& entry) {
    j = {
        {"id", entry.id},
        {"name", entry.name},
        {"size", entry.size},
        {"parent_id", entry.parent_id},
        {"content_type", entry.content_type},
        {"is_directory", entry.is_directory},
        {"created_at", timestampToString(entry.created_at)}
    };
}

void from_json(const nlohmann::json& j, Entry& entry) {
    entry.id = j.at("id").get<int64_t>();
    entry.name = j.value("name", std::string{});
    entry.size = j.contains("size") && !j["size"].is_null() ? j["size"].get<int64_t>() : 0;
    entry.content_type = j.contains("content_type") && !j["content_type"].is_null()
                             ? j["content_type"].get<std::string>()
                             : std::string{};

    if (j.contains("parent_id") && !j["parent_id"].is_null()) entry.parent_id = j["parent_id"].get<int64_t>();
    else entry.parent_id = ROOT_ID;

    if (j.contains("created_at") && j["created_at"].is_string())
        entry.created_at = parseApiTimestamp(j["created_at"].get<std::string>());
    else entry.created_at = 0;

    const bool folderType = j.contains("file_type") && j["file_type"].is_string() && j["file_type"] == "FOLDER";
    entry.is_directory = entry.content_type == DIRECTORY_CONTENT_TYPE || folderType;
}

std::vector<Entry> entriesFromJson(const nlohmann::json& j) {
    std::vector<Entry> out;
    if (!j.is_array()) return out;
    out.reserve(j.size());
    for (const auto& item : j) out.push_back(item.get<Entry>());
    return out;
}

}
