#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "remote/model/AccountInfo.hpp"
#include "remote/model/Entry.hpp"
#include "remote/model/Transfer.hpp"

using namespace pfs::remote::model;
using nlohmann::json;

TEST(EntryJsonTest, ParsesFileRecord) {
    const auto j = json::parse(R"({
        "id": 42, "name": "clip.mp4", "size": 1048576, "parent_id": 7,
        "content_type": "video/mp4", "created_at": "2016-07-15T08:53:37",
        "file_type": "VIDEO", "crc32": "deadbeef"
    })");

    const auto e = j.get<Entry>();
    EXPECT_EQ(e.id, 42);
    EXPECT_EQ(e.name, "clip.mp4");
    EXPECT_EQ(e.size, 1048576);
    EXPECT_EQ(e.parent_id, 7);
    EXPECT_FALSE(e.is_directory);
    EXPECT_EQ(e.created_at, 1468572817);
}

TEST(EntryJsonTest, DirectoryDetectedFromContentTypeOrFileType) {
    const auto byType = json::parse(R"({"id": 1, "name": "a", "content_type": "application/x-directory"})").get<Entry>();
    EXPECT_TRUE(byType.is_directory);

    const auto byFileType = json::parse(R"({"id": 2, "name": "b", "file_type": "FOLDER"})").get<Entry>();
    EXPECT_TRUE(byFileType.is_directory);
}

TEST(EntryJsonTest, NullParentAndSizeDefault) {
    const auto e = json::parse(R"({"id": 0, "name": "Your Files", "parent_id": null, "size": null})").get<Entry>();
    EXPECT_EQ(e.parent_id, ROOT_ID);
    EXPECT_EQ(e.size, 0);
    EXPECT_EQ(e.created_at, 0);
}

TEST(EntryJsonTest, ListSkipsNonArrays) {
    EXPECT_TRUE(entriesFromJson(json::object()).empty());
    EXPECT_EQ(entriesFromJson(json::parse(R"([{"id": 1}, {"id": 2}])")).size(), 2u);
}

TEST(EntryJsonTest, DumpCarriesReadableTimestamp) {
    Entry e;
    e.id = 3;
    e.name = "x";
    e.created_at = 1468572817;
    const json j = e;
    EXPECT_EQ(j.at("created_at"), "2016-07-15T08:53:37");
    EXPECT_EQ(j.at("id"), 3);
}

TEST(TransferJsonTest, ToleratesFloatAndStringCounters) {
    const auto t = json::parse(R"({
        "id": 9, "name": "debian.iso", "status": "DOWNLOADING",
        "size": 2000000, "downloaded": 1500.0, "down_speed": "12000", "up_speed": null,
        "percent_done": 12
    })").get<Transfer>();

    EXPECT_EQ(t.downloaded, 1500);
    EXPECT_EQ(t.down_speed, 12000);
    EXPECT_EQ(t.up_speed, 0);
    EXPECT_EQ(t.percent_done, 12);
    EXPECT_FALSE(t.isCompleted());
}

TEST(AccountJsonTest, ParsesDiskUsage) {
    const auto a = json::parse(R"({
        "username": "alice", "mail": "a@example.com", "account_active": true,
        "disk": {"avail": 100, "size": 300, "used": 200},
        "subtitle_languages": ["eng", "tur"]
    })").get<AccountInfo>();

    EXPECT_EQ(a.username, "alice");
    EXPECT_TRUE(a.account_active);
    EXPECT_EQ(a.disk.avail, 100);
    EXPECT_EQ(a.disk.size, 300);
    EXPECT_EQ(a.subtitle_languages.size(), 2u);
}
