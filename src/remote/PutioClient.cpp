#include "remote/PutioClient.hpp"
#include "remote/CurlRangeStream.hpp"
#include "logging/LogRegistry.hpp"
#include "util/curlWrappers.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

using namespace pfs::remote;
using namespace pfs::remote::model;
using namespace pfs::util;
using namespace pfs::logging;

namespace {
constexpr int64_t LIST_PAGE_SIZE = 1000;

void applyCommon(CURL* h, const pfs::config::ApiConfig& cfg, const SList& hdrs) {
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
    curl_easy_setopt(h, CURLOPT_USERAGENT, cfg.user_agent.c_str());
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, static_cast<long>(cfg.connect_timeout_seconds));
    curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(cfg.transfer_timeout_seconds));
}

void authHeaders(SList& hdrs, const pfs::config::ApiConfig& cfg) {
    hdrs.add("Authorization: Bearer " + cfg.token);
    hdrs.add("Accept: application/json");
}

void ensureOk(const std::string& op, const HttpResponse& resp) {
    if (resp.ok()) return;

    LogRegistry::cloud()->error("[PutioClient] {} failed: CURL={} HTTP={} Response:\n{}",
                                op, curl_easy_strerror(resp.curl), resp.http, resp.body);

    if (resp.curl != CURLE_OK)
        throw RemoteError(fmt::format("{} failed: {}", op, curl_easy_strerror(resp.curl)));
    throw RemoteError(fmt::format("{} failed (HTTP {}): {}", op, resp.http, resp.body), resp.http);
}

Entry fileFrom(const std::string& op, const nlohmann::json& j) {
    if (!j.contains("file") || !j["file"].is_object())
        throw RemoteError(op + " response carries no file record");
    try {
        return j["file"].get<Entry>();
    } catch (const nlohmann::json::exception& e) {
        throw RemoteError(fmt::format("{} returned a malformed file record: {}", op, e.what()));
    }
}
}

PutioClient::PutioClient(config::ApiConfig cfg) : cfg_(std::move(cfg)) {
    if (cfg_.token.empty()) throw std::runtime_error("PutioClient requires an access token");
    ensureCurlGlobalInit();
}

std::string PutioClient::encode(const Fields& fields) {
    CurlEasy h;
    std::string out;
    for (const auto& [k, v] : fields) {
        char* escaped = curl_easy_escape(h, v.c_str(), static_cast<int>(v.size()));
        if (!escaped) throw RemoteError("curl_easy_escape failed for field " + k);
        if (!out.empty()) out += '&';
        out += k + '=' + escaped;
        curl_free(escaped);
    }
    return out;
}

nlohmann::json PutioClient::parseBody(const std::string& op, const std::string& body, const long http) {
    auto j = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object())
        throw RemoteError(fmt::format("{} returned an unparseable body", op), http);

    if (j.contains("status") && j["status"] == "ERROR") {
        const auto msg = j.value("error_message", std::string{"unknown error"});
        LogRegistry::cloud()->error("[PutioClient] {} rejected: {}", op, msg);
        throw RemoteError(fmt::format("{} rejected: {}", op, msg), http);
    }
    return j;
}

nlohmann::json PutioClient::getJson(const std::string& path, const Fields& query) const {
    const std::string url = query.empty() ? cfg_.base_url + path : cfg_.base_url + path + "?" + encode(query);
    LogRegistry::cloud()->debug("[PutioClient] GET {}", url);

    SList hdrs;
    authHeaders(hdrs, cfg_);

    const auto resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        applyCommon(h, cfg_, hdrs);
    });

    ensureOk("GET " + path, resp);
    return parseBody("GET " + path, resp.body, resp.http);
}

nlohmann::json PutioClient::postForm(const std::string& path, const Fields& fields) const {
    const std::string url = cfg_.base_url + path;
    const std::string form = encode(fields);
    LogRegistry::cloud()->debug("[PutioClient] POST {} [{}]", url, form);

    SList hdrs;
    authHeaders(hdrs, cfg_);
    hdrs.add("Content-Type: application/x-www-form-urlencoded");

    const auto resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_POST, 1L);
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, form.c_str());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(form.size()));
        applyCommon(h, cfg_, hdrs);
    });

    ensureOk("POST " + path, resp);
    return parseBody("POST " + path, resp.body, resp.http);
}

std::string PutioClient::fileUrl(const int64_t id) const {
    return fmt::format("/files/{}", id);
}

std::vector<Entry> PutioClient::list(const int64_t parentId) {
    auto page = getJson("/files/list", {{"parent_id", std::to_string(parentId)},
                                        {"per_page", std::to_string(LIST_PAGE_SIZE)}});

    std::vector<Entry> entries;
    try {
        while (true) {
            auto chunk = entriesFromJson(page.value("files", nlohmann::json::array()));
            entries.insert(entries.end(), chunk.begin(), chunk.end());

            if (!page.contains("cursor") || !page["cursor"].is_string() || page["cursor"].get<std::string>().empty())
                break;

            page = postForm("/files/list/continue", {{"cursor", page["cursor"].get<std::string>()},
                                                     {"per_page", std::to_string(LIST_PAGE_SIZE)}});
        }
    } catch (const nlohmann::json::exception& e) {
        throw RemoteError(fmt::format("list of {} returned malformed records: {}", parentId, e.what()));
    }

    LogRegistry::cloud()->debug("[PutioClient] list({}) -> {} entries", parentId, entries.size());
    return entries;
}

Entry PutioClient::get(const int64_t id) {
    return fileFrom("get", getJson(fileUrl(id)));
}

void PutioClient::remove(const int64_t id) {
    (void)postForm("/files/delete", {{"file_ids", std::to_string(id)}});
}

void PutioClient::rename(const int64_t id, const std::string& newName) {
    (void)postForm("/files/rename", {{"file_id", std::to_string(id)}, {"name", newName}});
}

void PutioClient::move(const int64_t newParentId, const int64_t id) {
    (void)postForm("/files/move", {{"file_ids", std::to_string(id)}, {"parent_id", std::to_string(newParentId)}});
}

Entry PutioClient::createFolder(const std::string& name, const int64_t parentId) {
    return fileFrom("create-folder", postForm("/files/create-folder", {{"name", name},
                                                                       {"parent_id", std::to_string(parentId)}}));
}

Entry PutioClient::upload(const std::filesystem::path& source, const std::string& name, const int64_t parentId) {
    LogRegistry::cloud()->debug("[PutioClient] upload {} as {} into {}", source.string(), name, parentId);

    SList hdrs;
    authHeaders(hdrs, cfg_);

    curl_mime* mime = nullptr;
    const auto resp = performCurl([&](CURL* h) {
        mime = curl_mime_init(h);

        curl_mimepart* part = curl_mime_addpart(mime);
        curl_mime_name(part, "file");
        curl_mime_filedata(part, source.c_str());
        curl_mime_filename(part, name.c_str());

        part = curl_mime_addpart(mime);
        curl_mime_name(part, "filename");
        curl_mime_data(part, name.c_str(), CURL_ZERO_TERMINATED);

        const auto parent = std::to_string(parentId);
        part = curl_mime_addpart(mime);
        curl_mime_name(part, "parent_id");
        curl_mime_data(part, parent.c_str(), CURL_ZERO_TERMINATED);

        curl_easy_setopt(h, CURLOPT_URL, cfg_.upload_url.c_str());
        curl_easy_setopt(h, CURLOPT_MIMEPOST, mime);
        applyCommon(h, cfg_, hdrs);
    });
    curl_mime_free(mime);

    ensureOk("upload", resp);
    return fileFrom("upload", parseBody("upload", resp.body, resp.http));
}

std::unique_ptr<ByteStream> PutioClient::downloadRange(const int64_t id, const int64_t offset,
                                                       const std::optional<int64_t> length) {
    const auto j = getJson(fileUrl(id) + "/url", {{"use_tunnel", cfg_.use_tunnel ? "true" : "false"}});
    if (!j.contains("url") || !j["url"].is_string())
        throw RemoteError(fmt::format("could not fetch download URL for {}", id));

    return std::make_unique<CurlRangeStream>(j["url"].get<std::string>(), offset, length,
                                             cfg_.user_agent, static_cast<long>(cfg_.connect_timeout_seconds));
}

AccountInfo PutioClient::accountInfo() {
    const auto j = getJson("/account/info");
    if (!j.contains("info") || !j["info"].is_object()) throw RemoteError("account info response carries no info");
    try {
        return j["info"].get<AccountInfo>();
    } catch (const nlohmann::json::exception& e) {
        throw RemoteError(fmt::format("account info is malformed: {}", e.what()));
    }
}

std::vector<Transfer> PutioClient::listTransfers() {
    const auto j = getJson("/transfers/list");
    try {
        return transfersFromJson(j.value("transfers", nlohmann::json::array()));
    } catch (const nlohmann::json::exception& e) {
        throw RemoteError(fmt::format("transfer list is malformed: {}", e.what()));
    }
}
