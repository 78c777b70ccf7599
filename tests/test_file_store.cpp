#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include "../src/base64.hpp"
#include "../src/errors.hpp"
#include "../src/file_store.hpp"
#include "../src/temp_dir_registry.hpp"
#include "test_util.hpp"

namespace fs = std::filesystem;

static bool is_tracked(const fs::path& p) {
    auto dirs = TempDirRegistry::instance().tracked();
    return std::find(dirs.begin(), dirs.end(), p) != dirs.end();
}

TEST(FileStore, AllocatesOwnedTempDir) {
    fs::path dir;
    {
        FileStore store;
        dir = store.working_dir();
        EXPECT_TRUE(store.owns_working_dir());
        EXPECT_TRUE(fs::is_directory(dir));
        EXPECT_NE(dir.filename().string().find(FileStore::kDefaultPrefix), std::string::npos);
        EXPECT_TRUE(is_tracked(dir));
    }
    EXPECT_FALSE(fs::exists(dir));
    EXPECT_FALSE(is_tracked(dir));
}

TEST(FileStore, CallerDirectoryIsNeverRemoved) {
    ScopedTempDir tmp;
    auto dir = tmp.path() / "work";
    {
        FileStore store(dir);
        EXPECT_FALSE(store.owns_working_dir());
        EXPECT_TRUE(fs::is_directory(dir));
        store.upload({{"keep.txt", FileContent::text("x")}});
        store.cleanup();
    }
    EXPECT_EQ(read_file(dir / "keep.txt"), "x");
    EXPECT_FALSE(is_tracked(dir));
}

TEST(FileStore, RejectsParentTraversal) {
    ScopedTempDir tmp;
    auto root = tmp.path() / "root";
    FileStore store(root);
    EXPECT_THROW(store.upload({{"../evil.txt", FileContent::text("x")}}), PathSecurityError);
    EXPECT_FALSE(fs::exists(tmp.path() / "evil.txt"));
    EXPECT_THROW(store.upload({{"sub/../../evil.txt", FileContent::text("x")}}), PathSecurityError);
    EXPECT_FALSE(fs::exists(tmp.path() / "evil.txt"));
}

TEST(FileStore, RejectsAbsoluteAndRootKeys) {
    FileStore store;
    EXPECT_THROW(store.upload({{"/tmp/evalbox-abs.txt", FileContent::text("x")}}), PathSecurityError);
    EXPECT_THROW(store.upload({{"", FileContent::text("x")}}), PathSecurityError);
    EXPECT_THROW(store.upload({{".", FileContent::text("x")}}), PathSecurityError);
}

TEST(FileStore, RejectsSymlinkEscape) {
    ScopedTempDir tmp;
    auto root = tmp.path() / "root";
    auto outside = tmp.path() / "outside";
    fs::create_directories(outside);
    FileStore store(root);
    fs::create_directory_symlink(outside, root / "link");
    EXPECT_THROW(store.upload({{"link/evil.txt", FileContent::text("x")}}), PathSecurityError);
    EXPECT_FALSE(fs::exists(outside / "evil.txt"));
}

TEST(FileStore, DownloadSkipsSymlinks) {
    ScopedTempDir tmp;
    auto root = tmp.path() / "root";
    auto outside = tmp.path() / "outside";
    write_file(outside / "secret.txt", "host secret");
    FileStore store(root);
    store.upload({{"kept.txt", FileContent::text("ok")}});
    fs::create_symlink(outside / "secret.txt", root / "leak.txt");
    fs::create_directory_symlink(outside, root / "leakdir");
    fs::create_symlink(root / "kept.txt", root / "alias.txt");

    auto files = store.download();
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files.at("kept.txt").data, "ok");
}

TEST(FileStore, BadKeyWritesNothing) {
    FileStore store;
    Files files = {{"a_ok.txt", FileContent::text("1")}, {"../zz_evil.txt", FileContent::text("2")}};
    EXPECT_THROW(store.upload(files), PathSecurityError);
    EXPECT_TRUE(store.download().empty());
}

TEST(FileStore, TextRoundTrip) {
    FileStore store;
    Files files = {
        {"hello.py", FileContent::text("print('Hello, world!')")},
        {"nested/dir/notes.md", FileContent::text("# notes\n\xE2\x9C\x93 done\n")},
        {"empty.txt", FileContent::text("")},
    };
    store.upload(files);
    EXPECT_EQ(store.download(), files);
    // download is read-only
    EXPECT_EQ(store.download(), files);
}

TEST(FileStore, BinaryRoundTrip) {
    FileStore store;
    const std::string raw("\x00\xff\xfe\x80 binary\x01", 12);
    Files files = {{"blob.bin", FileContent::base64(base64_encode(raw))}};
    store.upload(files);
    EXPECT_EQ(read_file(store.working_dir() / "blob.bin"), raw);
    auto out = store.download();
    ASSERT_EQ(out.count("blob.bin"), 1u);
    EXPECT_TRUE(out["blob.bin"].is_binary());
    EXPECT_EQ(out, files);
}

TEST(FileStore, InvalidBase64WritesNothing) {
    FileStore store;
    EXPECT_THROW(store.upload({{"x.bin", FileContent::base64("%%%")}}), std::invalid_argument);
    EXPECT_FALSE(fs::exists(store.working_dir() / "x.bin"));
}

TEST(FileStore, OverwritesExistingFile) {
    FileStore store;
    store.upload({{"a.txt", FileContent::text("first version")}});
    store.upload({{"a.txt", FileContent::text("2")}});
    EXPECT_EQ(store.download().at("a.txt").data, "2");
}

TEST(FileStore, CleanupTwiceIsNoop) {
    FileStore store;
    auto dir = store.working_dir();
    store.cleanup();
    EXPECT_FALSE(fs::exists(dir));
    EXPECT_NO_THROW(store.cleanup());
    EXPECT_FALSE(store.owns_working_dir());
}

TEST(TempDirRegistry, SweepRemovesLeakedDirectories) {
    auto& registry = TempDirRegistry::instance();
    auto dir = make_unique_temp_dir("evalbox-leak-");
    write_file(dir / "a" / "b.txt", "left behind");
    registry.track(dir);
    registry.sweep();
    EXPECT_FALSE(fs::exists(dir));
    EXPECT_FALSE(is_tracked(dir));
}

TEST(TempDirRegistry, SweepToleratesMissingDirectories) {
    auto& registry = TempDirRegistry::instance();
    auto dir = make_unique_temp_dir("evalbox-gone-");
    registry.track(dir);
    fs::remove_all(dir);
    EXPECT_NO_THROW(registry.sweep());
    EXPECT_FALSE(is_tracked(dir));
}
