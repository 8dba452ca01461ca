#pragma once

#include "config/Config.hpp"
#include "remote/Store.hpp"

#include <nlohmann/json_fwd.hpp>
#include <string>
#include <utility>
#include <vector>

namespace pfs::remote {

// put.io v2 REST client. Authenticates every API call with the OAuth token.
class PutioClient final : public Store {
public:
    explicit PutioClient(config::ApiConfig cfg);

    std::vector<model::Entry> list(int64_t parentId) override;
    model::Entry get(int64_t id) override;
    void remove(int64_t id) override;
    void rename(int64_t id, const std::string& newName) override;
    void move(int64_t newParentId, int64_t id) override;
    model::Entry createFolder(const std::string& name, int64_t parentId) override;
    model::Entry upload(const std::filesystem::path& source, const std::string& name, int64_t parentId) override;
    std::unique_ptr<ByteStream> downloadRange(int64_t id, int64_t offset, std::optional<int64_t> length) override;
    model::AccountInfo accountInfo() override;
    std::vector<model::Transfer> listTransfers() override;

private:
    using Fields = std::vector<std::pair<std::string, std::string>>;

    config::ApiConfig cfg_;

    [[nodiscard]] std::string fileUrl(int64_t id) const;

    nlohmann::json getJson(const std::string& path, const Fields& query = {}) const;
    nlohmann::json postForm(const std::string& path, const Fields& fields) const;

    static nlohmann::json parseBody(const std::string& op, const std::string& body, long http);
    static std::string encode(const Fields& fields);
};

}
