#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace pfs::remote::model {

struct Transfer {
    int64_t id{0};
    std::string name, status, status_message;
    int64_t size{0};
    int64_t downloaded{0};
    int64_t down_speed{0};
    int64_t up_speed{0};
    int percent_done{0};

    [[nodiscard]] bool isCompleted() const { return status == "COMPLETED"; }
};

void from_json(const nlohmann::json& j, Transfer& t);

std::vector<Transfer> transfersFromJson(const nlohmann::json& j);

}
