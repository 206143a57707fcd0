#include <gtest/gtest.h>

#include <string>

#include "FileSystem/FileError.h"
#include "FileSystem/PathUtil.h"

using namespace Ferry::Core::IO;
namespace PathUtil = Ferry::Core::IO::PathUtil;

TEST(PathUtil, ParentOfNestedFile) {
    EXPECT_EQ(PathUtil::parent("/a/b/c.txt"), "/a/b");
    EXPECT_EQ(PathUtil::parent("a/b"), "a");
}

TEST(PathUtil, ParentOfBareNameIsEmpty) {
    EXPECT_EQ(PathUtil::parent("c.txt"), "");
}

TEST(PathUtil, ParentKeepsRoot) {
    EXPECT_EQ(PathUtil::parent("/c.txt"), "/");
    EXPECT_EQ(PathUtil::parent("/"), "/");
}

TEST(PathUtil, ParentStripsRepeatedSeparators) {
    EXPECT_EQ(PathUtil::parent("/a/b//c.txt"), "/a/b");
}

TEST(PathUtil, TrailingSeparatorIsSignificant) {
    EXPECT_EQ(PathUtil::parent("a/b/"), "a/b");
    EXPECT_EQ(PathUtil::leafName("a/b/"), "");
}

TEST(PathUtil, LeafName) {
    EXPECT_EQ(PathUtil::leafName("/a/b/c.txt"), "c.txt");
    EXPECT_EQ(PathUtil::leafName("c.txt"), "c.txt");
    EXPECT_EQ(PathUtil::leafName(""), "");
}

TEST(PathUtil, ExtensionIsLowercasedWithoutDot) {
    EXPECT_EQ(PathUtil::extension("/photos/IMG_001.JPG"), "jpg");
    EXPECT_EQ(PathUtil::extension("/photos/IMG_001.JPG", false), ".jpg");
}

TEST(PathUtil, ExtensionUsesLastDotOnly) {
    EXPECT_EQ(PathUtil::extension("archive.tar.gz"), "gz");
    auto [root, ext] = PathUtil::splitExtension("a/b.tar.gz");
    EXPECT_EQ(root, "a/b.tar");
    EXPECT_EQ(ext, ".gz");
}

TEST(PathUtil, DotfilesHaveNoExtension) {
    EXPECT_EQ(PathUtil::extension("/home/u/.bashrc"), "");
    EXPECT_EQ(PathUtil::extension("..hidden"), "");
    EXPECT_EQ(PathUtil::extension("/home/u/.config.bak"), "bak");
}

TEST(PathUtil, DotInDirectoryIsNotAnExtension) {
    EXPECT_EQ(PathUtil::extension("/a.d/readme"), "");
    auto [root, ext] = PathUtil::splitExtension("/a.d/readme");
    EXPECT_EQ(root, "/a.d/readme");
    EXPECT_TRUE(ext.empty());
}

TEST(PathUtil, WithExtensionReplacesExtension) {
    EXPECT_EQ(PathUtil::withExtension("/a/b/c.ext1", ".ext2"), "/a/b/c.ext2");
    EXPECT_EQ(PathUtil::withExtension("notes.TXT", ".md"), "notes.md");
}

TEST(PathUtil, WithExtensionRequiresExistingExtension) {
    try {
        PathUtil::withExtension("/a/b/Makefile", ".txt");
        FAIL() << "expected FileOperationError";
    } catch (const FileOperationError& e) {
        EXPECT_EQ(e.code(), FileError::InvalidPath);
        EXPECT_EQ(e.info().path, "/a/b/Makefile");
    }
}

TEST(PathUtil, JoinInsertsSeparator) {
    EXPECT_EQ(PathUtil::join("/a", "b.txt"), "/a/b.txt");
    EXPECT_EQ(PathUtil::join("/a/", "b.txt"), "/a/b.txt");
    EXPECT_EQ(PathUtil::join("", "b.txt"), "b.txt");
}

TEST(PathUtil, JoinWithAbsoluteChildReturnsChild) {
    EXPECT_EQ(PathUtil::join("/a", "/etc/hosts"), "/etc/hosts");
}

TEST(PathUtil, NormalizeExtension) {
    EXPECT_EQ(PathUtil::normalizeExtension(".PNG"), "png");
    EXPECT_EQ(PathUtil::normalizeExtension("Txt"), "txt");
    EXPECT_EQ(PathUtil::normalizeExtension(""), "");
}
