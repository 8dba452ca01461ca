#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace pfs::remote::model {

struct DiskUsage {
    int64_t avail{0};
    int64_t size{0};
    int64_t used{0};
};

struct AccountInfo {
    int64_t user_id{0};
    std::string username, mail, avatar_url, plan_expiration_date, default_subtitle_language;
    bool account_active{false}, has_voucher{false};
    int days_until_files_deletion{0};
    int simultaneous_download_limit{0};
    std::vector<std::string> subtitle_languages;
    DiskUsage disk;
};

void to_json(nlohmann::json& j, const DiskUsage& d);
void from_json(const nlohmann::json& j, DiskUsage& d);
void to_json(nlohmann::json& j, const AccountInfo& a);
void from_json(const nlohmann::json& j, AccountInfo& a);

}
