#include <gtest/gtest.h>

#include <filesystem>
#include <set>
#include <string>
#include <vector>

#if !defined(_WIN32)
#include <unistd.h>
#endif

#include "FerryTestHelpers.h"
#include "FileSystem/DirectoryWalker.h"
#include "FileSystem/FileError.h"
#include "FileSystem/FileUtilities.h"
#include "FileSystem/PathUtil.h"

using namespace Ferry::Core::IO;
using ferry::test_helpers::ScopedTempDir;
using ferry::test_helpers::writeFile;
namespace fs = std::filesystem;

namespace {
    std::vector<std::string> collect(DirectoryWalker walker) {
        std::vector<std::string> out;
        for (const auto& entry : walker) {
            out.push_back(entry.fullPath());
        }
        return out;
    }

    std::vector<std::string> leafNames(const std::vector<DirectoryEntry>& entries) {
        std::vector<std::string> out;
        for (const auto& e : entries) out.push_back(e.leafName());
        return out;
    }

    // root/{a.txt, b.png, sub/c.txt}
    void makeSampleTree(const ScopedTempDir& tmp) {
        writeFile(tmp.join("root/a.txt"), "a");
        writeFile(tmp.join("root/b.png"), "png");
        writeFile(tmp.join("root/sub/c.txt"), "c");
    }
}

TEST(DirectoryWalker, RecurseFilesWithExtensionAllowlist) {
    ScopedTempDir tmp;
    makeSampleTree(tmp);

    TraversalFilter filter;
    filter.setAllowedExtensions({"txt"});
    auto found = collect(DirectoryWalker::recurseFiles(tmp.str("root"), filter));

    const std::set<std::string> expected{
        PathUtil::join(tmp.str("root"), "a.txt"),
        PathUtil::join(PathUtil::join(tmp.str("root"), "sub"), "c.txt"),
    };
    EXPECT_EQ(std::set<std::string>(found.begin(), found.end()), expected);
    EXPECT_EQ(found.size(), 2u);
}

TEST(DirectoryWalker, AllowlistIsCaseInsensitiveAndIgnoresLeadingDot) {
    ScopedTempDir tmp;
    writeFile(tmp.join("root/UPPER.TXT"), "u");
    writeFile(tmp.join("root/lower.txt"), "l");
    writeFile(tmp.join("root/other.md"), "m");

    TraversalFilter filter;
    filter.setAllowedExtensions({".Txt"});
    auto found = collect(DirectoryWalker::recurseFiles(tmp.str("root"), filter));
    EXPECT_EQ(found.size(), 2u);
}

TEST(DirectoryWalker, RecurseFilesWithoutFilterFindsEverything) {
    ScopedTempDir tmp;
    makeSampleTree(tmp);

    auto found = collect(DirectoryWalker::recurseFiles(tmp.str("root")));
    EXPECT_EQ(found.size(), 3u);
}

TEST(DirectoryWalker, FilesComeBeforeSubdirectoriesInNameOrder) {
    ScopedTempDir tmp;
    writeFile(tmp.join("root/z.txt"), "z");
    writeFile(tmp.join("root/a/inner.txt"), "i");
    writeFile(tmp.join("root/m.txt"), "m");

    std::vector<std::string> leaves;
    for (const auto& entry : DirectoryWalker::recurseFiles(tmp.str("root"))) {
        leaves.push_back(entry.leafName());
    }
#if !defined(_WIN32)
    EXPECT_EQ(leaves, (std::vector<std::string>{"m.txt", "z.txt", "inner.txt"}));
#else
    EXPECT_EQ(leaves.size(), 3u);
#endif
}

TEST(DirectoryWalker, PredicatePrunesSubtree) {
    ScopedTempDir tmp;
    writeFile(tmp.join("root/keep/a.txt"), "a");
    writeFile(tmp.join("root/.git/objects/b.txt"), "b");
    writeFile(tmp.join("root/c.txt"), "c");

    int predicateCalls = 0;
    TraversalFilter filter;
    filter.directoryPredicate = [&](const std::string& dir) {
        ++predicateCalls;
        return PathUtil::leafName(dir) != ".git";
    };

    auto found = collect(DirectoryWalker::recurseFiles(tmp.str("root"), filter));
    EXPECT_EQ(found.size(), 2u);
    for (const auto& path : found) {
        EXPECT_EQ(path.find(".git"), std::string::npos) << path;
    }
    // keep and .git; nothing below .git is ever offered
    EXPECT_EQ(predicateCalls, 2);
}

TEST(DirectoryWalker, RecurseDirsStartsWithRootAndAppliesPredicate) {
    ScopedTempDir tmp;
    fs::create_directories(tmp.join("root/a/deep"));
    fs::create_directories(tmp.join("root/skip/below"));
    writeFile(tmp.join("root/file.txt"), "f");

    TraversalFilter filter;
    filter.directoryPredicate = [](const std::string& dir) { return PathUtil::leafName(dir) != "skip"; };

    auto found = collect(DirectoryWalker::recurseDirs(tmp.str("root"), filter));
    ASSERT_EQ(found.size(), 3u);
    EXPECT_EQ(found[0], tmp.str("root"));
    EXPECT_EQ(PathUtil::leafName(found[1]), "a");
    EXPECT_EQ(PathUtil::leafName(found[2]), "deep");
}

TEST(DirectoryWalker, WalkCanReportFilesAndDirectories) {
    ScopedTempDir tmp;
    makeSampleTree(tmp);

    TraversalFilter filter;
    filter.includeDirectories = true;
    std::vector<DirectoryEntry> entries;
    for (const auto& e : DirectoryWalker::walk(tmp.str("root"), filter)) {
        entries.push_back(e);
    }
    ASSERT_EQ(entries.size(), 5u);
    EXPECT_TRUE(entries[0].isDirectory());
    EXPECT_EQ(entries[0].fullPath(), tmp.str("root"));
#if !defined(_WIN32)
    EXPECT_EQ(leafNames(entries), (std::vector<std::string>{"root", "a.txt", "b.png", "sub", "c.txt"}));
#endif
}

TEST(DirectoryWalker, ListChildrenIsSingleLevel) {
    ScopedTempDir tmp;
    makeSampleTree(tmp);

    auto children = DirectoryWalker::listChildren(tmp.str("root"));
    EXPECT_EQ(leafNames(children).size(), 3u);
#if !defined(_WIN32)
    EXPECT_EQ(leafNames(children), (std::vector<std::string>{"a.txt", "b.png", "sub"}));
#endif

    auto files = DirectoryWalker::listFiles(tmp.str("root"));
    EXPECT_EQ(files.size(), 2u);
    for (const auto& f : files) EXPECT_FALSE(f.isDirectory());

    auto dirs = DirectoryWalker::listDirs(tmp.str("root"));
    ASSERT_EQ(dirs.size(), 1u);
    EXPECT_EQ(dirs[0].leafName(), "sub");
    EXPECT_TRUE(dirs[0].isDirectory());
}

TEST(DirectoryWalker, ListFilesHonorsAllowlist) {
    ScopedTempDir tmp;
    makeSampleTree(tmp);

    TraversalFilter filter;
    filter.setAllowedExtensions(std::vector<std::string>{"PNG"});
    auto files = DirectoryWalker::listFiles(tmp.str("root"), filter);
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].leafName(), "b.png");
}

TEST(DirectoryWalker, MissingRootThrowsImmediately) {
    ScopedTempDir tmp;
    try {
        auto walker = DirectoryWalker::recurseFiles(tmp.str("nope"));
        FAIL() << "expected FileOperationError";
    } catch (const FileOperationError& e) {
        EXPECT_EQ(e.code(), FileError::SourceMissing);
        EXPECT_EQ(e.info().operation, "recurseFiles");
    }
    EXPECT_THROW(DirectoryWalker::listChildren(tmp.str("nope")), FileOperationError);
}

TEST(DirectoryWalker, FileAsRootIsInvalidPath) {
    ScopedTempDir tmp;
    writeFile(tmp.join("plain.txt"), "x");
    try {
        DirectoryWalker::listChildren(tmp.str("plain.txt"));
        FAIL() << "expected FileOperationError";
    } catch (const FileOperationError& e) {
        EXPECT_EQ(e.code(), FileError::InvalidPath);
    }
}

TEST(DirectoryWalker, EntryMetadataIsFetchedLazily) {
    ScopedTempDir tmp;
    writeFile(tmp.join("root/five.bin"), "12345");
    setLastModTime(tmp.str("root/five.bin"), 1600000000, TimeUnits::Seconds);

    auto files = DirectoryWalker::listFiles(tmp.str("root"));
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].size(), 5u);
    EXPECT_EQ(files[0].modifiedTime(), 1600000000);
    EXPECT_EQ(files[0].modifiedTime(TimeUnits::Milliseconds), 1600000000000LL);
}

TEST(DirectoryWalker, EntryMetadataAfterDeletionThrows) {
    ScopedTempDir tmp;
    writeFile(tmp.join("root/ephemeral.txt"), "x");

    auto files = DirectoryWalker::listFiles(tmp.str("root"));
    ASSERT_EQ(files.size(), 1u);
    fs::remove(tmp.join("root/ephemeral.txt"));
    try {
        (void)files[0].size();
        FAIL() << "expected FileOperationError";
    } catch (const FileOperationError& e) {
        EXPECT_EQ(e.code(), FileError::TraversalEntry);
    }
}

#if !defined(_WIN32)
TEST(DirectoryWalker, UnreadableSubdirectoryGoesToErrorHandler) {
    if (::geteuid() == 0) {
        GTEST_SKIP() << "permission checks do not apply to root";
    }
    ScopedTempDir tmp;
    writeFile(tmp.join("root/ok/a.txt"), "a");
    writeFile(tmp.join("root/locked/secret.txt"), "s");
    writeFile(tmp.join("root/z.txt"), "z");
    fs::permissions(tmp.join("root/locked"), fs::perms::none);

    std::vector<std::string> errors;
    auto handler = [&](const std::string& path, const FileErrorInfo& err) {
        EXPECT_EQ(err.code, FileError::TraversalEntry);
        errors.push_back(path);
    };
    auto found = collect(DirectoryWalker::recurseFiles(tmp.str("root"), {}, handler));

    fs::permissions(tmp.join("root/locked"), fs::perms::owner_all);

    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(PathUtil::leafName(errors[0]), "locked");
    EXPECT_EQ(found.size(), 2u);
}

TEST(DirectoryWalker, UnreadableSubdirectoryWithoutHandlerThrows) {
    if (::geteuid() == 0) {
        GTEST_SKIP() << "permission checks do not apply to root";
    }
    ScopedTempDir tmp;
    writeFile(tmp.join("root/locked/secret.txt"), "s");
    fs::permissions(tmp.join("root/locked"), fs::perms::none);

    EXPECT_THROW(collect(DirectoryWalker::recurseFiles(tmp.str("root"))), FileOperationError);

    fs::permissions(tmp.join("root/locked"), fs::perms::owner_all);
}

#endif

namespace {
    // Runs while the parent is listed, so the removed subtree fails on descent
    DirectoryPredicate removingPredicate(const std::string& doomedLeaf) {
        return [doomedLeaf](const std::string& dir) {
            if (PathUtil::leafName(dir) == doomedLeaf) {
                fs::remove_all(dir);
            }
            return true;
        };
    }
}

TEST(DirectoryWalker, VanishedSubdirectoryGoesToErrorHandler) {
    ScopedTempDir tmp;
    writeFile(tmp.join("root/doomed/lost.txt"), "l");
    writeFile(tmp.join("root/keep/kept.txt"), "k");
    writeFile(tmp.join("root/top.txt"), "t");

    TraversalFilter filter;
    filter.directoryPredicate = removingPredicate("doomed");

    std::vector<std::string> errors;
    auto handler = [&](const std::string& path, const FileErrorInfo& err) {
        EXPECT_EQ(err.code, FileError::TraversalEntry);
        EXPECT_TRUE(err.systemError.has_value());
        errors.push_back(path);
    };
    auto found = collect(DirectoryWalker::recurseFiles(tmp.str("root"), filter, handler));

    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(PathUtil::leafName(errors[0]), "doomed");
    ASSERT_EQ(found.size(), 2u);
    std::set<std::string> leaves;
    for (const auto& p : found) leaves.insert(PathUtil::leafName(p));
    EXPECT_EQ(leaves, (std::set<std::string>{"top.txt", "kept.txt"}));
}

TEST(DirectoryWalker, VanishedSubdirectoryWithoutHandlerAbortsTheWalk) {
    ScopedTempDir tmp;
    writeFile(tmp.join("root/doomed/lost.txt"), "l");

    TraversalFilter filter;
    filter.directoryPredicate = removingPredicate("doomed");

    try {
        collect(DirectoryWalker::recurseFiles(tmp.str("root"), filter));
        FAIL() << "expected FileOperationError";
    } catch (const FileOperationError& e) {
        EXPECT_EQ(e.code(), FileError::TraversalEntry);
        EXPECT_EQ(PathUtil::leafName(e.info().path), "doomed");
        EXPECT_EQ(e.info().operation, "recurseFiles");
    }
}

#if !defined(_WIN32)
TEST(DirectoryWalker, SymlinkedDirectoriesAreNotFollowedByDefault) {
    ScopedTempDir tmp;
    writeFile(tmp.join("target/inside.txt"), "i");
    fs::create_directories(tmp.join("root"));
    fs::create_directory_symlink(tmp.join("target"), tmp.join("root/link"));

    EXPECT_TRUE(collect(DirectoryWalker::recurseFiles(tmp.str("root"))).empty());

    TraversalFilter follow;
    follow.followSymlinks = true;
    EXPECT_EQ(collect(DirectoryWalker::recurseFiles(tmp.str("root"), follow)).size(), 1u);
}

TEST(DirectoryWalker, SymlinkCycleIsNotFollowedForever) {
    ScopedTempDir tmp;
    writeFile(tmp.join("root/a/file.txt"), "f");
    fs::create_directory_symlink(tmp.join("root"), tmp.join("root/a/loop"));

    TraversalFilter follow;
    follow.followSymlinks = true;
    auto found = collect(DirectoryWalker::recurseFiles(tmp.str("root"), follow));
    EXPECT_EQ(found.size(), 1u);
}
#endif
