#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

#include "FerryTestHelpers.h"
#include "FileSystem/FileError.h"
#include "FileSystem/FileUtilities.h"

using namespace Ferry::Core::IO;
using ferry::test_helpers::readAllBytes;
using ferry::test_helpers::ScopedTempDir;
using ferry::test_helpers::writeFile;
namespace fs = std::filesystem;

TEST(FileUtilities, MakeDirsCreatesChainAndIsIdempotent) {
    ScopedTempDir tmp;
    const auto dir = tmp.str("a/b/c");

    makeDirs(dir);
    EXPECT_TRUE(fs::is_directory(dir));
    EXPECT_NO_THROW(makeDirs(dir));
}

TEST(FileUtilities, MakeDirsOverFileIsInvalidPath) {
    ScopedTempDir tmp;
    writeFile(tmp.join("occupied"), "x");

    try {
        makeDirs(tmp.str("occupied"));
        FAIL() << "expected FileOperationError";
    } catch (const FileOperationError& e) {
        EXPECT_EQ(e.code(), FileError::InvalidPath);
        EXPECT_EQ(e.info().operation, "makeDirs");
    }
}

TEST(FileUtilities, EnsureEmptyDirectoryClearsContentsAndIsIdempotent) {
    ScopedTempDir tmp;
    const auto dir = tmp.str("work");
    writeFile(tmp.join("work/a.txt"), "a");
    writeFile(tmp.join("work/sub/deeper/b.txt"), "b");

    ensureEmptyDirectory(dir);
    EXPECT_TRUE(fs::is_directory(dir));
    EXPECT_TRUE(isEmptyDir(dir));

    EXPECT_NO_THROW(ensureEmptyDirectory(dir));
    EXPECT_TRUE(fs::is_directory(dir));
    EXPECT_TRUE(isEmptyDir(dir));
}

TEST(FileUtilities, EnsureEmptyDirectoryCreatesMissingDirectory) {
    ScopedTempDir tmp;
    const auto dir = tmp.str("fresh/nested");

    ensureEmptyDirectory(dir);
    EXPECT_TRUE(fs::is_directory(dir));
    EXPECT_TRUE(isEmptyDir(dir));
}

TEST(FileUtilities, EnsureEmptyDirectoryRejectsFile) {
    ScopedTempDir tmp;
    writeFile(tmp.join("file"), "keep me");

    try {
        ensureEmptyDirectory(tmp.str("file"));
        FAIL() << "expected FileOperationError";
    } catch (const FileOperationError& e) {
        EXPECT_EQ(e.code(), FileError::InvalidPath);
    }
    EXPECT_EQ(readAllBytes(tmp.join("file")), "keep me");
}

TEST(FileUtilities, DeleteFileRemovesFile) {
    ScopedTempDir tmp;
    writeFile(tmp.join("gone.txt"), "bye");

    deleteFile(tmp.str("gone.txt"));
    EXPECT_FALSE(fs::exists(tmp.join("gone.txt")));
}

TEST(FileUtilities, DeleteFileMissingIsSourceMissing) {
    ScopedTempDir tmp;
    try {
        deleteFile(tmp.str("never.txt"));
        FAIL() << "expected FileOperationError";
    } catch (const FileOperationError& e) {
        EXPECT_EQ(e.code(), FileError::SourceMissing);
    }
}

TEST(FileUtilities, DeleteFileOnDirectoryIsInvalidPath) {
    ScopedTempDir tmp;
    fs::create_directory(tmp.join("dir"));
    EXPECT_THROW(deleteFile(tmp.str("dir")), FileOperationError);
    EXPECT_TRUE(fs::is_directory(tmp.join("dir")));
}

TEST(FileUtilities, DeleteSureToleratesMissingFile) {
    ScopedTempDir tmp;
    writeFile(tmp.join("x"), "x");

    EXPECT_NO_THROW(deleteSure(tmp.str("x")));
    EXPECT_NO_THROW(deleteSure(tmp.str("x")));
    EXPECT_FALSE(fs::exists(tmp.join("x")));
}

TEST(FileUtilities, FileContentsEqual) {
    ScopedTempDir tmp;
    std::string big(200 * 1024, 'q');
    writeFile(tmp.join("a"), big);
    writeFile(tmp.join("b"), big);
    big[150 * 1024] = 'r';
    writeFile(tmp.join("c"), big);
    writeFile(tmp.join("short"), "q");

    EXPECT_TRUE(fileContentsEqual(tmp.str("a"), tmp.str("b")));
    EXPECT_FALSE(fileContentsEqual(tmp.str("a"), tmp.str("c")));
    EXPECT_FALSE(fileContentsEqual(tmp.str("a"), tmp.str("short")));
}

TEST(FileUtilities, ReadAllMissingFile) {
    ScopedTempDir tmp;
    try {
        readAll(tmp.str("missing.bin"));
        FAIL() << "expected FileOperationError";
    } catch (const FileOperationError& e) {
        EXPECT_EQ(e.code(), FileError::SourceMissing);
    }
}

TEST(FileUtilities, WriteAllThenReadAll) {
    ScopedTempDir tmp;
    const auto path = tmp.str("data.txt");

    EXPECT_TRUE(writeAll(path, std::string_view("line one\nline two\n")));
    EXPECT_EQ(readAllText(path), "line one\nline two\n");

    EXPECT_TRUE(writeAll(path, std::string_view("short")));
    EXPECT_EQ(readAllText(path), "short");
    EXPECT_EQ(readAll(path).size(), 5u);
}

TEST(FileUtilities, WriteAllSkipsIdenticalContent) {
    ScopedTempDir tmp;
    const auto path = tmp.str("same.txt");
    writeFile(tmp.join("same.txt"), "unchanged");

    WriteAllOptions opts;
    opts.skipIfSameContent = true;
    opts.updateTimeIfSameContent = false;

    setLastModTime(path, 1000000000, TimeUnits::Seconds);
    EXPECT_FALSE(writeAll(path, std::string_view("unchanged"), opts));
    EXPECT_EQ(getLastModTime(path), 1000000000);

    EXPECT_TRUE(writeAll(path, std::string_view("changed"), opts));
    EXPECT_EQ(readAllText(path), "changed");
}

TEST(FileUtilities, WriteAllSkipCanStillTouchModTime) {
    ScopedTempDir tmp;
    const auto path = tmp.str("touch.txt");
    writeFile(tmp.join("touch.txt"), "payload");
    setLastModTime(path, 1000000000, TimeUnits::Seconds);

    WriteAllOptions opts;
    opts.skipIfSameContent = true;
    EXPECT_FALSE(writeAll(path, std::string_view("payload"), opts));
    EXPECT_GT(getLastModTime(path), 1000000000);
}

TEST(FileUtilities, ModTimeRoundTripsAcrossUnits) {
    ScopedTempDir tmp;
    const auto path = tmp.str("t.txt");
    writeFile(tmp.join("t.txt"), "t");

    setLastModTime(path, 1500000000123LL, TimeUnits::Milliseconds);
    EXPECT_EQ(getLastModTime(path, TimeUnits::Seconds), 1500000000);
    EXPECT_EQ(getLastModTime(path, TimeUnits::Milliseconds), 1500000000123LL);
    EXPECT_EQ(getLastModTime(path, TimeUnits::Nanoseconds) / 1000000, 1500000000123LL);
}

TEST(FileUtilities, GetLastModTimeMissingFile) {
    ScopedTempDir tmp;
    EXPECT_THROW(getLastModTime(tmp.str("nope")), FileOperationError);
}
