#include "remote/model/AccountInfo.hpp"

#include <nlohmann/json.hpp>

namespace pfs::remote::model {

namespace {
template <typename T>
T valueOr(const nlohmann::json& j, const char* key, T def) {
    if (!j.contains(key) || j[key].is_null()) return def;
    return j[key].get<T>();
}
}

void to_json(nlohmann::json& j, const DiskUsage& d) {
    j = {
        {"avail", d.avail},
        {"size", d.size},
        {"used", d.used}
    };
}

void from_json(const nlohmann::json& j, DiskUsage& d) {
    d.avail = valueOr<int64_t>(j, "avail", 0);
    d.size = valueOr<int64_t>(j, "size", 0);
    d.used = valueOr<int64_t>(j, "used", 0);
}

void to_json(nlohmann::json& j, const AccountInfo& a) {
    j = {
        {"account_active", a.account_active},
        {"avatar_url", a.avatar_url},
        {"days_until_files_deletion", a.days_until_files_deletion},
        {"default_subtitle_language", a.default_subtitle_language},
        {"disk", a.disk},
        {"has_voucher", a.has_voucher},
        {"mail", a.mail},
        {"plan_expiration_date", a.plan_expiration_date},
        {"simultaneous_download_limit", a.simultaneous_download_limit},
        {"subtitle_languages", a.subtitle_languages},
        {"user_id", a.user_id},
        {"username", a.username}
    };
}

void from_json(const nlohmann::json& j, AccountInfo& a) {
    a.account_active = valueOr<bool>(j, "account_active", false);
    a.avatar_url = valueOr<std::string>(j, "avatar_url", "");
    a.days_until_files_deletion = valueOr<int>(j, "days_until_files_deletion", 0);
    a.default_subtitle_language = valueOr<std::string>(j, "default_subtitle_language", "");
    if (j.contains("disk") && j["disk"].is_object()) j["disk"].get_to(a.disk);
    a.has_voucher = valueOr<bool>(j, "has_voucher", false);
    a.mail = valueOr<std::string>(j, "mail", "");
    a.plan_expiration_date = valueOr<std::string>(j, "plan_expiration_date", "");
    a.simultaneous_download_limit = valueOr<int>(j, "simultaneous_download_limit", 0);
    a.subtitle_languages = valueOr<std::vector<std::string>>(j, "subtitle_languages", {});
    a.user_id = valueOr<int64_t>(j, "user_id", 0);
    a.username = valueOr<std::string>(j, "username", "");
}

}
