#include <gtest/gtest.h>
#include <cerrno>
#include <chrono>
#include <filesystem>
#include "FSTestHelpers.h"
#include "FileSystem/LocalFilePrimitives.h"

using namespace Steadfast::Core::IO;
using steadfast::test_helpers::ScopedTempDir;
using steadfast::test_helpers::readText;
using steadfast::test_helpers::runningAsRoot;
using steadfast::test_helpers::writeText;
namespace fs = std::filesystem;

TEST(LocalFilePrimitives, MissingPathsMapToFileNotFound) {
    ScopedTempDir tmp;
    LocalFilePrimitives prims;
    auto missing = tmp.join("missing").string();

    FileMetadata meta;
    std::vector<std::byte> bytes;
    EXPECT_EQ(prims.stat(missing, meta).code, FileError::FileNotFound);
    EXPECT_EQ(prims.readFile(missing, bytes).code, FileError::FileNotFound);
    EXPECT_EQ(prims.unlink(missing).code, FileError::FileNotFound);
    EXPECT_EQ(prims.rmdir(missing).code, FileError::FileNotFound);
    EXPECT_EQ(prims.removeAll(missing).code, FileError::FileNotFound);

    auto err = prims.rename(missing, tmp.join("elsewhere").string());
    EXPECT_EQ(err.code, FileError::FileNotFound);
    EXPECT_EQ(err.path, missing);
}

TEST(LocalFilePrimitives, ExistingDirectoryMapsToAlreadyExists) {
    ScopedTempDir tmp;
    LocalFilePrimitives prims;
    auto dir = tmp.join("d").string();

    EXPECT_TRUE(prims.mkdir(dir, 0755).ok());
    auto again = prims.mkdir(dir, 0755);
    EXPECT_EQ(again.code, FileError::AlreadyExists);
    ASSERT_TRUE(again.systemError.has_value());
    EXPECT_EQ(again.systemError->value(), EEXIST);
    EXPECT_TRUE(prims.createDirectories(dir).ok());
}

TEST(LocalFilePrimitives, NonEmptyRmdirIsIOError) {
    ScopedTempDir tmp;
    LocalFilePrimitives prims;
    auto dir = tmp.join("full");
    fs::create_directories(dir);
    writeText(dir / "f.txt", "x");

    EXPECT_EQ(prims.rmdir(dir.string()).code, FileError::IOError);
}

TEST(LocalFilePrimitives, WriteWithoutPermissionIsAccessDenied) {
    if (runningAsRoot()) GTEST_SKIP() << "permission bits are not enforced for root";
    ScopedTempDir tmp;
    LocalFilePrimitives prims;
    auto dir = tmp.join("ro");
    fs::create_directories(dir);
    fs::permissions(dir, fs::perms::owner_read | fs::perms::owner_exec, fs::perm_options::replace);

    uint64_t written = 0;
    const std::byte data[] = {std::byte{'x'}};
    auto err = prims.writeFile((dir / "f.txt").string(), data, WriteOptions{}, written);
    EXPECT_EQ(err.code, FileError::AccessDenied);
    EXPECT_EQ(written, 0u);
}

TEST(LocalFilePrimitives, MoveWithoutOverwriteRefusesExistingDestination) {
    ScopedTempDir tmp;
    LocalFilePrimitives prims;
    writeText(tmp.join("a"), "a");
    writeText(tmp.join("b"), "b");

    auto err = prims.move(tmp.join("a").string(), tmp.join("b").string(), false);
    EXPECT_EQ(err.code, FileError::AlreadyExists);
    EXPECT_EQ(readText(tmp.join("b")), "b");

    EXPECT_TRUE(prims.move(tmp.join("a").string(), tmp.join("b").string(), true).ok());
    EXPECT_EQ(readText(tmp.join("b")), "a");
}

TEST(LocalFilePrimitives, CopyPreservesModeAndCopiesTrees) {
    ScopedTempDir tmp;
    LocalFilePrimitives prims;
    auto src = tmp.join("tool.sh");
    writeText(src, "#!/bin/sh\n");
    fs::permissions(src, fs::perms::owner_all, fs::perm_options::replace);

    ASSERT_TRUE(prims.copyFile(src.string(), tmp.join("copy.sh").string(), CopyOptions{}).ok());
    EXPECT_EQ(fs::status(tmp.join("copy.sh")).permissions() & fs::perms::all, fs::perms::owner_all);

    fs::create_directories(tmp.join("tree/sub"));
    writeText(tmp.join("tree/sub/leaf.txt"), "leaf");
    ASSERT_TRUE(prims.copyFile(tmp.join("tree").string(), tmp.join("tree2").string(), CopyOptions{}).ok());
    EXPECT_EQ(readText(tmp.join("tree2/sub/leaf.txt")), "leaf");
}

TEST(LocalFilePrimitives, StatReportsIdentity) {
    ScopedTempDir tmp;
    LocalFilePrimitives prims;
    writeText(tmp.join("f"), "12345");

    FileMetadata meta;
    ASSERT_TRUE(prims.stat(tmp.join("f").string(), meta).ok());
    EXPECT_TRUE(meta.exists);
    EXPECT_EQ(meta.size, 5u);
    EXPECT_NE(meta.inode, 0u);
    EXPECT_EQ(meta.linkCount, 1u);
    EXPECT_EQ(prims.getBackendType(), "LocalFileSystem");
}

TEST(LocalFilePrimitives, MoveReportsTheDestinationItCouldNotWrite) {
    if (runningAsRoot()) GTEST_SKIP() << "permission bits are not enforced for root";
    ScopedTempDir tmp;
    LocalFilePrimitives prims;
    auto src = tmp.join("src.txt");
    auto dir = tmp.join("ro");
    writeText(src, "x");
    fs::create_directories(dir);
    fs::permissions(dir, fs::perms::owner_read | fs::perms::owner_exec, fs::perm_options::replace);
    auto dst = (dir / "dst.txt").string();

    auto moved = prims.move(src.string(), dst, true);
    EXPECT_EQ(moved.code, FileError::AccessDenied);
    EXPECT_EQ(moved.path, dst);

    auto renamed = prims.rename(src.string(), dst);
    EXPECT_EQ(renamed.code, FileError::AccessDenied);
    EXPECT_EQ(renamed.path, dst);

    auto missing = tmp.join("missing.txt").string();
    auto gone = prims.move(missing, tmp.join("other.txt").string(), true);
    EXPECT_EQ(gone.code, FileError::FileNotFound);
    EXPECT_EQ(gone.path, missing);
}

TEST(LocalFilePrimitives, UtimesAcceptsTimesBeforeTheEpoch) {
    ScopedTempDir tmp;
    LocalFilePrimitives prims;
    auto path = tmp.join("old.txt");
    writeText(path, "x");

    // 1969-12-31 23:59:58.75
    auto stamp = std::chrono::system_clock::time_point(std::chrono::milliseconds(-1250));
    auto err = prims.utimes(path.string(), stamp, stamp);
    ASSERT_TRUE(err.ok()) << err.message;

    FileMetadata meta;
    ASSERT_TRUE(prims.stat(path.string(), meta).ok());
    ASSERT_TRUE(meta.lastModified.has_value());
    EXPECT_LT(std::chrono::abs(*meta.lastModified - stamp), std::chrono::milliseconds(1));
}
