#include "FsFixture.hpp"

#include <cerrno>

#include "fs/DiagnosticNode.hpp"
#include "fs/cache/Registry.hpp"

#include <algorithm>

using namespace pfs::fs;
using namespace pfs::test;

class DirectoryNodeTest : public FsFixture {
protected:
    void SetUp() override {
        FsFixture::SetUp();
        moviesId = store->addFolder("Movies");
        docsId = store->addFolder("Docs");
        notesId = store->addFile("notes.txt", "hello world");
        store->addFile("plot.txt", "spoilers", moviesId);
        store->resetCalls();
    }

    int64_t moviesId{}, docsId{}, notesId{};
};

TEST_F(DirectoryNodeTest, ReadDirAllListsExactlyTheRemoteChildren) {
    auto entries = root()->readDirAll();
    std::sort(entries.begin(), entries.end(), [](const auto& a, const auto& b) { return a.name < b.name; });

    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].name, "Docs");
    EXPECT_TRUE(entries[0].is_directory);
    EXPECT_EQ(entries[1].name, "Movies");
    EXPECT_TRUE(entries[1].is_directory);
    EXPECT_EQ(entries[2].name, "notes.txt");
    EXPECT_FALSE(entries[2].is_directory);
    EXPECT_EQ(store->calls.list, 1);
}

TEST_F(DirectoryNodeTest, ReadDirAllOmitsPseudoFiles) {
    for (const auto& e : root()->readDirAll()) {
        EXPECT_NE(e.name, ACCOUNT_FILE_NAME);
        EXPECT_NE(e.name, TRANSFERS_FILE_NAME);
    }
}

TEST_F(DirectoryNodeTest, LookupResolvesNodeKindFromEntry) {
    const auto dir = lookupAs<DirectoryNode>(*root(), "Movies");
    ASSERT_TRUE(dir);
    EXPECT_EQ(dir->id(), moviesId);
    EXPECT_TRUE(dir->isDirectory());
    EXPECT_TRUE(S_ISDIR(dir->attr().st_mode));

    const auto file = lookupAs<FileNode>(*root(), "notes.txt");
    ASSERT_TRUE(file);
    EXPECT_EQ(file->id(), notesId);
    EXPECT_EQ(file->attr().st_size, 11);
    EXPECT_EQ(file->attr().st_mode & 0777u, 0644u);
    EXPECT_EQ(file->attr().st_mtim.tv_sec, 1468572817);
    EXPECT_EQ(file->attr().st_atim.tv_sec, file->attr().st_ctim.tv_sec);
}

TEST_F(DirectoryNodeTest, LookupIsCaseSensitive) {
    EXPECT_EQ(errcOf([&] { (void)root()->lookup("movies"); }), Errc::NotFound);
}

TEST_F(DirectoryNodeTest, LookupMissingNameIsNotFound) {
    EXPECT_EQ(errcOf([&] { (void)root()->lookup("absent"); }), Errc::NotFound);
    EXPECT_EQ(store->calls.list, 1);
}

TEST_F(DirectoryNodeTest, JunkLookupsNeverReachTheStore) {
    EXPECT_EQ(errcOf([&] { (void)root()->lookup("._foo"); }), Errc::NotFound);
    EXPECT_EQ(errcOf([&] { (void)root()->lookup(".DS_Store"); }), Errc::NotFound);
    EXPECT_EQ(errcOf([&] { (void)root()->lookup(".git"); }), Errc::NotFound);
    EXPECT_EQ(store->calls.total(), 0);
}

TEST_F(DirectoryNodeTest, ListFailureIsIOFailure) {
    store->failList = true;
    EXPECT_EQ(errcOf([&] { (void)root()->lookup("Movies"); }), Errc::IOFailure);
    EXPECT_EQ(errcOf([&] { (void)root()->readDirAll(); }), Errc::IOFailure);
}

TEST_F(DirectoryNodeTest, MkdirOnExistingNameIsAlreadyExistsWithoutCreateFolder) {
    EXPECT_EQ(errcOf([&] { (void)root()->mkdir("Movies"); }), Errc::AlreadyExists);
    EXPECT_EQ(store->calls.createFolder, 0);
}

TEST_F(DirectoryNodeTest, MkdirCreatesRemoteFolder) {
    const auto node = std::dynamic_pointer_cast<DirectoryNode>(root()->mkdir("Music"));
    ASSERT_TRUE(node);
    EXPECT_EQ(store->calls.createFolder, 1);

    const auto id = store->idOf("Music", pfs::remote::model::ROOT_ID);
    ASSERT_TRUE(id);
    EXPECT_EQ(node->id(), *id);
    EXPECT_TRUE(store->entry(*id).is_directory);
}

TEST_F(DirectoryNodeTest, CreateUploadsEmptyPlaceholderAndOpensWriteHandle) {
    auto [node, handle] = root()->create("new.txt");
    ASSERT_TRUE(node);
    ASSERT_TRUE(handle);
    EXPECT_EQ(store->calls.upload, 1);

    const auto id = store->idOf("new.txt", pfs::remote::model::ROOT_ID);
    ASSERT_TRUE(id);
    EXPECT_EQ(store->content(*id), "");
    EXPECT_EQ(node->remoteId(), id);
    handle->release();
}

TEST_F(DirectoryNodeTest, CreateOnExistingNameIsAlreadyExists) {
    EXPECT_EQ(errcOf([&] { (void)root()->create("notes.txt"); }), Errc::AlreadyExists);
    EXPECT_EQ(store->calls.upload, 0);
}

TEST_F(DirectoryNodeTest, RemoveDeletesByName) {
    root()->remove("notes.txt");
    EXPECT_FALSE(store->exists(notesId));
    EXPECT_EQ(store->calls.remove, 1);
}

TEST_F(DirectoryNodeTest, RemoveRefusesRootAndSentinel) {
    EXPECT_EQ(errcOf([&] { root()->remove("/"); }), Errc::InvalidRequest);
    EXPECT_EQ(errcOf([&] { root()->remove(TOP_LEVEL_SENTINEL_NAME); }), Errc::InvalidRequest);
    EXPECT_EQ(store->calls.total(), 0);
}

TEST_F(DirectoryNodeTest, RemoveMissingNameIsNotFound) {
    EXPECT_EQ(errcOf([&] { root()->remove("absent"); }), Errc::NotFound);
    EXPECT_EQ(store->calls.remove, 0);
}

TEST_F(DirectoryNodeTest, RmdirOfNonEmptyFolderIsNotEmpty) {
    EXPECT_EQ(errcOf([&] { root()->rmdir("Movies"); }), Errc::NotEmpty);
    EXPECT_TRUE(store->exists(moviesId));
    EXPECT_EQ(store->calls.remove, 0);
}

TEST_F(DirectoryNodeTest, RmdirDeletesEmptyFolder) {
    root()->rmdir("Docs");
    EXPECT_FALSE(store->exists(docsId));
    EXPECT_EQ(store->calls.remove, 1);
}

TEST_F(DirectoryNodeTest, RmdirRefusesSentinel) {
    EXPECT_EQ(errcOf([&] { root()->rmdir(TOP_LEVEL_SENTINEL_NAME); }), Errc::InvalidRequest);
    EXPECT_EQ(store->calls.total(), 0);
}

TEST_F(DirectoryNodeTest, NotEmptyMapsToENOTEMPTY) {
    EXPECT_EQ(FsError(Errc::NotEmpty, "Movies").toErrno(), ENOTEMPTY);
}

TEST_F(DirectoryNodeTest, RenameToSameNameInSameDirectoryMakesNoCalls) {
    root()->rename("notes.txt", *root(), "notes.txt");
    EXPECT_EQ(store->calls.total(), 0);
}

TEST_F(DirectoryNodeTest, RenameWithinDirectoryIsNameOnly) {
    root()->rename("notes.txt", *root(), "todo.txt");

    EXPECT_EQ(store->calls.rename, 1);
    EXPECT_EQ(store->calls.move, 0);
    EXPECT_EQ(store->entry(notesId).name, "todo.txt");
    EXPECT_NO_THROW((void)root()->lookup("todo.txt"));
    EXPECT_EQ(errcOf([&] { (void)root()->lookup("notes.txt"); }), Errc::NotFound);
}

TEST_F(DirectoryNodeTest, RenameAcrossDirectoriesMovesThenRenames) {
    const auto docs = lookupAs<DirectoryNode>(*root(), "Docs");
    ASSERT_TRUE(docs);

    root()->rename("notes.txt", *docs, "readme.txt");

    EXPECT_EQ(store->calls.move, 1);
    EXPECT_EQ(store->calls.rename, 1);
    EXPECT_NO_THROW((void)docs->lookup("readme.txt"));
    EXPECT_EQ(errcOf([&] { (void)root()->lookup("notes.txt"); }), Errc::NotFound);
}

TEST_F(DirectoryNodeTest, RenameAcrossDirectoriesKeepingNameOnlyMoves) {
    const auto docs = lookupAs<DirectoryNode>(*root(), "Docs");
    ASSERT_TRUE(docs);
    store->resetCalls();

    root()->rename("notes.txt", *docs, "notes.txt");

    EXPECT_EQ(store->calls.move, 1);
    EXPECT_EQ(store->calls.rename, 0);
    EXPECT_EQ(store->entry(notesId).parent_id, docsId);
}

TEST_F(DirectoryNodeTest, RenameMissingNameIsNotFound) {
    EXPECT_EQ(errcOf([&] { root()->rename("absent", *root(), "other"); }), Errc::NotFound);
    EXPECT_EQ(store->calls.rename, 0);
}

TEST_F(DirectoryNodeTest, RenameRefreshesLiveNodeSnapshot) {
    std::shared_ptr<Node> file = root()->lookup("notes.txt");
    filesystem->registry().bind(file);
    const auto docs = lookupAs<DirectoryNode>(*root(), "Docs");

    root()->rename("notes.txt", *docs, "moved.txt");

    const auto snapshot = std::dynamic_pointer_cast<FileNode>(file)->snapshot();
    EXPECT_EQ(snapshot->name, "moved.txt");
    EXPECT_EQ(snapshot->parent_id, docsId);
}

TEST_F(DirectoryNodeTest, SymlinkIsNotSupported) {
    EXPECT_EQ(errcOf([&] { (void)root()->symlink("link", "/etc/passwd"); }), Errc::NotSupported);
    EXPECT_EQ(store->calls.total(), 0);
}

TEST_F(DirectoryNodeTest, DirectoriesCannotBeOpenedOrSynced) {
    EXPECT_EQ(errcOf([&] { (void)root()->open(OpenIntent::Read); }), Errc::NotSupported);
    EXPECT_EQ(errcOf([&] { root()->fsync(); }), Errc::NotSupported);
}
