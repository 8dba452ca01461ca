#include "FsFixture.hpp"

#include "fs/WriteHandle.hpp"
#include "fs/cache/Registry.hpp"

using namespace pfs::fs;
using namespace pfs::test;

class WriteHandleTest : public FsFixture {
protected:
    void SetUp() override {
        FsFixture::SetUp();
        fileId = store->addFile("draft.txt", "original");
        file = lookupAs<FileNode>(*root(), "draft.txt");
        store->resetCalls();
    }

    [[nodiscard]] std::string readBack(const std::string& name) {
        const auto reopened = lookupAs<FileNode>(*root(), name);
        const auto handle = reopened->open(OpenIntent::Read);
        return handle->read(0, 1024);
    }

    int64_t fileId{};
    std::shared_ptr<FileNode> file;
};

TEST_F(WriteHandleTest, OpenForWriteYieldsWriteHandle) {
    const auto handle = file->open(OpenIntent::Write);
    EXPECT_NE(dynamic_cast<WriteHandle*>(handle.get()), nullptr);
    EXPECT_EQ(store->calls.total(), 0);
}

TEST_F(WriteHandleTest, OverlappingWritesFlushAsOneUpload) {
    const auto handle = file->open(OpenIntent::Write);

    EXPECT_EQ(handle->write(0, "AAAA", 4), 4u);
    EXPECT_EQ(handle->write(2, "BB", 2), 2u);
    EXPECT_EQ(store->calls.total(), 0);

    handle->flush();
    handle->release();

    EXPECT_EQ(store->calls.upload, 1);
    EXPECT_EQ(store->calls.remove, 1);
    EXPECT_FALSE(store->exists(fileId));
    EXPECT_EQ(readBack("draft.txt"), "AABB");
}

TEST_F(WriteHandleTest, FlushAdoptsUploadedEntry) {
    const auto handle = file->open(OpenIntent::Write);
    handle->write(0, "new body", 8);
    handle->flush();

    const auto newId = store->idOf("draft.txt", pfs::remote::model::ROOT_ID);
    ASSERT_TRUE(newId);
    EXPECT_NE(*newId, fileId);
    EXPECT_EQ(file->id(), *newId);
    EXPECT_EQ(file->attr().st_size, 8);
    EXPECT_EQ(store->entry(*newId).parent_id, pfs::remote::model::ROOT_ID);
    handle->release();
}

TEST_F(WriteHandleTest, FlushKeepsInodeAcrossReupload) {
    std::shared_ptr<Node> node = file;
    auto& registry = filesystem->registry();
    const auto ino = registry.bind(node);

    const auto handle = file->open(OpenIntent::Write);
    handle->write(0, "xyz", 3);
    handle->flush();

    EXPECT_EQ(registry.get(ino), node);
    EXPECT_EQ(registry.findById(file->id()), node);
    EXPECT_EQ(registry.findById(fileId), nullptr);
    handle->release();
}

TEST_F(WriteHandleTest, FlushWithoutWritesMakesNoCalls) {
    const auto handle = file->open(OpenIntent::Write);
    handle->flush();
    handle->release();
    EXPECT_EQ(store->calls.total(), 0);
}

TEST_F(WriteHandleTest, SecondFlushIsNoopOnceClean) {
    const auto handle = file->open(OpenIntent::Write);
    handle->write(0, "abc", 3);
    handle->flush();
    handle->flush();
    handle->release();
    EXPECT_EQ(store->calls.upload, 1);
}

TEST_F(WriteHandleTest, ReleaseWithoutFlushDiscardsContent) {
    const auto handle = file->open(OpenIntent::Write);
    handle->write(0, "lost", 4);
    handle->release();

    EXPECT_EQ(store->calls.upload, 0);
    EXPECT_EQ(store->calls.remove, 0);
    EXPECT_EQ(store->content(fileId), "original");
}

TEST_F(WriteHandleTest, WriteAfterReleaseIsIOFailure) {
    const auto handle = file->open(OpenIntent::Write);
    handle->release();
    EXPECT_EQ(errcOf([&] { (void)handle->write(0, "x", 1); }), Errc::IOFailure);
}

TEST_F(WriteHandleTest, FailedUploadStaysDirty) {
    auto handle = file->open(OpenIntent::Write);
    handle->write(0, "data", 4);
    store->failUpload = true;

    EXPECT_EQ(errcOf([&] { handle->flush(); }), Errc::IOFailure);
    EXPECT_TRUE(dynamic_cast<WriteHandle&>(*handle).dirty());

    store->failUpload = false;
    handle->flush();
    handle->release();

    EXPECT_EQ(store->calls.remove, 1);
    EXPECT_EQ(store->calls.upload, 2);
    const auto newId = store->idOf("draft.txt", pfs::remote::model::ROOT_ID);
    ASSERT_TRUE(newId);
    EXPECT_EQ(store->content(*newId), "data");
}

TEST_F(WriteHandleTest, FlushReuploadsWhenRemoteCopyIsAlreadyGone) {
    const auto handle = file->open(OpenIntent::Write);
    handle->write(0, "kept", 4);
    store->remove(fileId);
    store->resetCalls();

    handle->flush();
    handle->release();

    EXPECT_EQ(store->calls.upload, 1);
    const auto newId = store->idOf("draft.txt", pfs::remote::model::ROOT_ID);
    ASSERT_TRUE(newId);
    EXPECT_EQ(store->content(*newId), "kept");
}

TEST_F(WriteHandleTest, AppendToExistingFileIsNotSupported) {
    const auto handle = file->open(OpenIntent::Write);
    EXPECT_EQ(errcOf([&] { (void)handle->write(8, "!", 1); }), Errc::NotSupported);
    EXPECT_FALSE(dynamic_cast<WriteHandle&>(*handle).dirty());

    handle->flush();
    handle->release();

    EXPECT_EQ(store->calls.total(), 0);
    EXPECT_EQ(store->content(fileId), "original");
}

TEST_F(WriteHandleTest, PatchPastStagedBytesIsNotSupported) {
    const auto handle = file->open(OpenIntent::Write);
    handle->write(0, "or", 2);
    EXPECT_EQ(errcOf([&] { (void)handle->write(4, "XX", 2); }), Errc::NotSupported);
    handle->release();
}

TEST_F(WriteHandleTest, AppendAfterTruncateToZeroIsAllowed) {
    const auto handle = file->open(OpenIntent::Write);
    file->truncate(0);

    handle->write(0, "ab", 2);
    handle->write(4, "ef", 2);
    handle->flush();
    handle->release();

    EXPECT_EQ(readBack("draft.txt"), std::string("ab\0\0ef", 6));
}

TEST_F(WriteHandleTest, AppendAfterRestagingWholeContentIsAllowed) {
    const auto handle = file->open(OpenIntent::Write);
    handle->write(0, "original", 8);
    handle->write(8, "!", 1);
    handle->flush();
    handle->release();

    EXPECT_EQ(readBack("draft.txt"), "original!");
}

TEST_F(WriteHandleTest, StagingFileIsRemovedOnRelease) {
    const auto handle = file->open(OpenIntent::Write);
    handle->write(0, "tmp", 3);
    EXPECT_FALSE(std::filesystem::is_empty(stagingDir));

    handle->release();
    EXPECT_TRUE(std::filesystem::is_empty(stagingDir));
}

TEST_F(WriteHandleTest, CreateThenWriteFlushReplacesPlaceholder) {
    auto [node, handle] = root()->create("fresh.txt");
    handle->write(0, "hello", 5);
    handle->flush();
    handle->release();

    EXPECT_EQ(store->calls.upload, 2);
    EXPECT_EQ(store->calls.remove, 1);
    EXPECT_EQ(readBack("fresh.txt"), "hello");
}
