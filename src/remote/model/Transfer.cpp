#include "remote/model/Transfer.hpp"

#include <nlohmann/json.hpp>

namespace pfs::remote::model {

namespace {
// the API reports some counters as floats or strings depending on transfer state
int64_t numberOr(const nlohmann::json& j, const char* key) {
    if (!j.contains(key)) return 0;
    const auto& v = j[key];
    if (v.is_number_integer()) return v.get<int64_t>();
    if (v.is_number()) return static_cast<int64_t>(v.get<double>());
    if (v.is_string()) {
        try { return std::stoll(v.get<std::string>()); }
        catch (const std::exception&) { return 0; }
    }
    return 0;
}
}

void from_json(const nlohmann::json& j, Transfer& t) {
    t.id = numberOr(j, "id");
    t.name = j.contains("name") && j["name"].is_string() ? j["name"].get<std::string>() : std::string{};
    t.status = j.contains("status") && j["status"].is_string() ? j["status"].get<std::string>() : std::string{};
    t.status_message = j.contains("status_message") && j["status_message"].is_string()
                           ? j["status_message"].get<std::string>()
                           : std::string{};
    t.size = numberOr(j, "size");
    t.downloaded = numberOr(j, "downloaded");
    t.down_speed = numberOr(j, "down_speed");
    t.up_speed = numberOr(j, "up_speed");
    t.percent_done = static_cast<int>(numberOr(j, "percent_done"));
}

std::vector<Transfer> transfersFromJson(const nlohmann::json& j) {
    std::vector<Transfer> out;
    if (!j.is_array()) return out;
    out.reserve(j.size());
    for (const auto& item : j) out.push_back(item.get<Transfer>());
    return out;
}

}
