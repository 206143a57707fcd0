#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <random>
#include <string>

#include "FerryTestHelpers.h"
#include "FileSystem/AtomicTransferEngine.h"
#include "FileSystem/FileError.h"
#include "FileSystem/FileUtilities.h"
#include "Hashing/HashEngine.h"

using namespace Ferry::Core::IO;
using Ferry::Core::Hashing::HashEngine;
using ferry::test_helpers::readAllBytes;
using ferry::test_helpers::ScopedTempDir;
using ferry::test_helpers::writeFile;
namespace fs = std::filesystem;

namespace {
    TransferRequest request(const std::string& src, const std::string& dst, bool overwrite = false) {
        TransferRequest r;
        r.source = src;
        r.destination = dst;
        r.overwrite = overwrite;
        return r;
    }

    // Temporary siblings left in a directory (there should never be any after a call returns)
    size_t strayTempCount(const fs::path& dir) {
        size_t n = 0;
        for (const auto& e : fs::directory_iterator(dir)) {
            if (e.path().filename().string().find(".ferry-") != std::string::npos) ++n;
        }
        return n;
    }
}

TEST(AtomicTransfer, CopyToNewPath) {
    ScopedTempDir tmp;
    writeFile(tmp.join("src.txt"), "hello world");

    AtomicTransferEngine engine;
    auto outcome = engine.copy(request(tmp.str("src.txt"), tmp.str("dst.txt")));

    EXPECT_EQ(outcome.bytesTransferred, 11u);
    EXPECT_FALSE(outcome.noOp);
    EXPECT_EQ(readAllBytes(tmp.join("dst.txt")), "hello world");
    EXPECT_EQ(readAllBytes(tmp.join("src.txt")), "hello world");
    EXPECT_EQ(strayTempCount(tmp.path()), 0u);
}

TEST(AtomicTransfer, CopyLargeFileMatchesDigest) {
    ScopedTempDir tmp;
    std::string payload(10 * 1024 * 1024, '\0');
    std::mt19937 rng(1234);
    for (auto& c : payload) c = static_cast<char>(rng() & 0xFF);
    writeFile(tmp.join("big.bin"), payload);

    AtomicTransferEngine engine;
    engine.copy(request(tmp.str("big.bin"), tmp.str("big.copy")));

    EXPECT_EQ(HashEngine::computeHash(tmp.str("big.copy"), "sha256"),
              HashEngine::computeHash(tmp.str("big.bin"), "sha256"));
}

TEST(AtomicTransfer, CopyConflictLeavesDestinationUntouched) {
    ScopedTempDir tmp;
    writeFile(tmp.join("src.txt"), "new content");
    writeFile(tmp.join("dst.txt"), "original");

    AtomicTransferEngine engine;
    try {
        engine.copy(request(tmp.str("src.txt"), tmp.str("dst.txt")));
        FAIL() << "expected DestinationConflict";
    } catch (const FileOperationError& e) {
        EXPECT_EQ(e.code(), FileError::DestinationConflict);
        EXPECT_EQ(e.info().operation, "copy");
        EXPECT_EQ(e.info().path, tmp.str("src.txt"));
        EXPECT_EQ(e.info().destinationPath, tmp.str("dst.txt"));
    }
    EXPECT_EQ(readAllBytes(tmp.join("dst.txt")), "original");
    EXPECT_EQ(strayTempCount(tmp.path()), 0u);
}

TEST(AtomicTransfer, CopyOverwriteReplacesDestination) {
    ScopedTempDir tmp;
    writeFile(tmp.join("src.txt"), "replacement");
    writeFile(tmp.join("dst.txt"), "old");

    AtomicTransferEngine engine;
    engine.copy(request(tmp.str("src.txt"), tmp.str("dst.txt"), true));
    EXPECT_EQ(readAllBytes(tmp.join("dst.txt")), "replacement");
}

TEST(AtomicTransfer, CopyMissingSource) {
    ScopedTempDir tmp;
    AtomicTransferEngine engine;
    try {
        engine.copy(request(tmp.str("absent"), tmp.str("dst")));
        FAIL() << "expected SourceMissing";
    } catch (const FileOperationError& e) {
        EXPECT_EQ(e.code(), FileError::SourceMissing);
    }
    EXPECT_FALSE(fs::exists(tmp.join("dst")));
}

TEST(AtomicTransfer, CopyDirectoryRequiresOptIn) {
    ScopedTempDir tmp;
    writeFile(tmp.join("tree/a.txt"), "a");

    AtomicTransferEngine engine;
    try {
        engine.copy(request(tmp.str("tree"), tmp.str("tree2")));
        FAIL() << "expected SourceMissing";
    } catch (const FileOperationError& e) {
        EXPECT_EQ(e.code(), FileError::SourceMissing);
    }
    EXPECT_FALSE(fs::exists(tmp.join("tree2")));
}

TEST(AtomicTransfer, CopyIntoMissingParentWithoutCreateFails) {
    ScopedTempDir tmp;
    writeFile(tmp.join("src.txt"), "x");

    AtomicTransferEngine engine;
    EXPECT_THROW(engine.copy(request(tmp.str("src.txt"), tmp.str("no/such/dir/dst.txt"))), FileOperationError);
    EXPECT_FALSE(fs::exists(tmp.join("no")));
}

TEST(AtomicTransfer, CopyCreatesParentDirectories) {
    ScopedTempDir tmp;
    writeFile(tmp.join("src.txt"), "deep");

    auto req = request(tmp.str("src.txt"), tmp.str("x/y/z/dst.txt"));
    req.createParentDirs = true;

    AtomicTransferEngine engine;
    engine.copy(req);
    EXPECT_EQ(readAllBytes(tmp.join("x/y/z/dst.txt")), "deep");
}

TEST(AtomicTransfer, IdenticalPathIsNoOp) {
    ScopedTempDir tmp;
    writeFile(tmp.join("same.txt"), "content");

    AtomicTransferEngine engine;
    auto copied = engine.copy(request(tmp.str("same.txt"), tmp.str("same.txt")));
    EXPECT_TRUE(copied.noOp);

    auto moved = engine.move(request(tmp.str("same.txt"), (tmp.path() / "." / "same.txt").string()));
    EXPECT_TRUE(moved.noOp);
    EXPECT_EQ(readAllBytes(tmp.join("same.txt")), "content");
}

TEST(AtomicTransfer, PreserveModTimeKeepsDestinationTimestamp) {
    ScopedTempDir tmp;
    writeFile(tmp.join("src.txt"), "fresh");
    writeFile(tmp.join("dst.txt"), "stale");
    setLastModTime(tmp.str("dst.txt"), 1234567890, TimeUnits::Seconds);

    auto req = request(tmp.str("src.txt"), tmp.str("dst.txt"), true);
    req.preserveModTime = true;

    AtomicTransferEngine engine;
    engine.copy(req);
    EXPECT_EQ(readAllBytes(tmp.join("dst.txt")), "fresh");
    EXPECT_EQ(getLastModTime(tmp.str("dst.txt")), 1234567890);
}

TEST(AtomicTransfer, MoveToNewPath) {
    ScopedTempDir tmp;
    writeFile(tmp.join("src.txt"), "moving");

    AtomicTransferEngine engine;
    auto outcome = engine.move(request(tmp.str("src.txt"), tmp.str("dst.txt")));

    EXPECT_FALSE(fs::exists(tmp.join("src.txt")));
    EXPECT_EQ(readAllBytes(tmp.join("dst.txt")), "moving");
    EXPECT_EQ(outcome.bytesTransferred, 6u);
    EXPECT_FALSE(outcome.usedCrossVolumeFallback);
}

TEST(AtomicTransfer, MoveConflictLeavesBothFiles) {
    ScopedTempDir tmp;
    writeFile(tmp.join("src.txt"), "source");
    writeFile(tmp.join("dst.txt"), "destination");

    AtomicTransferEngine engine;
    try {
        engine.move(request(tmp.str("src.txt"), tmp.str("dst.txt")));
        FAIL() << "expected DestinationConflict";
    } catch (const FileOperationError& e) {
        EXPECT_EQ(e.code(), FileError::DestinationConflict);
        EXPECT_EQ(e.info().operation, "move");
    }
    EXPECT_EQ(readAllBytes(tmp.join("src.txt")), "source");
    EXPECT_EQ(readAllBytes(tmp.join("dst.txt")), "destination");
}

TEST(AtomicTransfer, MoveOverwriteReplacesDestination) {
    ScopedTempDir tmp;
    writeFile(tmp.join("src.txt"), "winner");
    writeFile(tmp.join("dst.txt"), "loser");

    AtomicTransferEngine engine;
    engine.move(request(tmp.str("src.txt"), tmp.str("dst.txt"), true));

    EXPECT_FALSE(fs::exists(tmp.join("src.txt")));
    EXPECT_EQ(readAllBytes(tmp.join("dst.txt")), "winner");
}

TEST(AtomicTransfer, CopyDirectoryTree) {
    ScopedTempDir tmp;
    writeFile(tmp.join("tree/a.txt"), "a");
    writeFile(tmp.join("tree/sub/b.txt"), "bb");
    fs::create_directories(tmp.join("tree/empty"));

    auto req = request(tmp.str("tree"), tmp.str("copy"));
    req.allowDirectories = true;

    AtomicTransferEngine engine;
    auto outcome = engine.copy(req);

    EXPECT_EQ(outcome.bytesTransferred, 3u);
    EXPECT_EQ(readAllBytes(tmp.join("copy/a.txt")), "a");
    EXPECT_EQ(readAllBytes(tmp.join("copy/sub/b.txt")), "bb");
    EXPECT_TRUE(fs::is_directory(tmp.join("copy/empty")));
    EXPECT_TRUE(fs::exists(tmp.join("tree/a.txt")));
    EXPECT_EQ(strayTempCount(tmp.path()), 0u);
}

TEST(AtomicTransfer, CopyDirectoryConflictLeavesDestination) {
    ScopedTempDir tmp;
    writeFile(tmp.join("tree/a.txt"), "a");
    writeFile(tmp.join("existing/keep.txt"), "keep");

    auto req = request(tmp.str("tree"), tmp.str("existing"));
    req.allowDirectories = true;

    AtomicTransferEngine engine;
    try {
        engine.copy(req);
        FAIL() << "expected DestinationConflict";
    } catch (const FileOperationError& e) {
        EXPECT_EQ(e.code(), FileError::DestinationConflict);
    }
    EXPECT_EQ(readAllBytes(tmp.join("existing/keep.txt")), "keep");
    EXPECT_FALSE(fs::exists(tmp.join("existing/a.txt")));
}

TEST(AtomicTransfer, CopyDirectoryOverwriteReplacesTree) {
    ScopedTempDir tmp;
    writeFile(tmp.join("tree/a.txt"), "new");
    writeFile(tmp.join("existing/old.txt"), "old");

    auto req = request(tmp.str("tree"), tmp.str("existing"), true);
    req.allowDirectories = true;

    AtomicTransferEngine engine;
    engine.copy(req);

    EXPECT_EQ(readAllBytes(tmp.join("existing/a.txt")), "new");
    EXPECT_FALSE(fs::exists(tmp.join("existing/old.txt")));
    EXPECT_EQ(strayTempCount(tmp.path()), 0u);
}

TEST(AtomicTransfer, MoveDirectory) {
    ScopedTempDir tmp;
    writeFile(tmp.join("tree/sub/b.txt"), "b");

    auto req = request(tmp.str("tree"), tmp.str("moved"));
    req.allowDirectories = true;

    AtomicTransferEngine engine;
    engine.move(req);

    EXPECT_FALSE(fs::exists(tmp.join("tree")));
    EXPECT_EQ(readAllBytes(tmp.join("moved/sub/b.txt")), "b");
}

TEST(AtomicTransfer, MoveDirectoryConflict) {
    ScopedTempDir tmp;
    writeFile(tmp.join("tree/a.txt"), "a");
    writeFile(tmp.join("taken/x.txt"), "x");

    auto req = request(tmp.str("tree"), tmp.str("taken"));
    req.allowDirectories = true;

    AtomicTransferEngine engine;
    EXPECT_THROW(engine.move(req), FileOperationError);
    EXPECT_TRUE(fs::exists(tmp.join("tree/a.txt")));
    EXPECT_EQ(readAllBytes(tmp.join("taken/x.txt")), "x");
}

TEST(AtomicTransfer, ChunkSizeFromEnvironmentIsHonored) {
    ::setenv("FERRY_COPY_CHUNK_SIZE", "4K", 1);
    auto config = AtomicTransferEngine::Config::fromEnvironment();
    ::unsetenv("FERRY_COPY_CHUNK_SIZE");
    EXPECT_EQ(config.copyChunkSize, 4096u);

    ScopedTempDir tmp;
    writeFile(tmp.join("src.bin"), std::string(10000, 'z'));
    AtomicTransferEngine engine(config);
    EXPECT_EQ(engine.copy(request(tmp.str("src.bin"), tmp.str("dst.bin"))).bytesTransferred, 10000u);
    EXPECT_EQ(readAllBytes(tmp.join("dst.bin")), std::string(10000, 'z'));
}

TEST(AtomicTransfer, OversizedChunkSizeFromEnvironmentFallsBackToDefault) {
    const size_t defaultChunk = AtomicTransferEngine::Config{}.copyChunkSize;
    for (const char* raw : {"99999999999999999999999", "18446744073709551615M", "18014398509481984K"}) {
        ::setenv("FERRY_COPY_CHUNK_SIZE", raw, 1);
        auto config = AtomicTransferEngine::Config::fromEnvironment();
        ::unsetenv("FERRY_COPY_CHUNK_SIZE");
        EXPECT_EQ(config.copyChunkSize, defaultChunk) << raw;
    }
}

TEST(AtomicTransfer, RejectsZeroChunkSize) {
    AtomicTransferEngine::Config config;
    config.copyChunkSize = 0;
    EXPECT_THROW(AtomicTransferEngine{config}, std::invalid_argument);
}

TEST(AtomicTransfer, DirectoryIntoItsOwnSubtreeIsRejected) {
    ScopedTempDir tmp;
    writeFile(tmp.join("album/one.jpg"), "1");

    AtomicTransferEngine engine;
    for (const char* dest : {"album/inner", "album/./nested/deeper", "album/sub/../inner"}) {
        auto req = request(tmp.str("album"), tmp.str(dest));
        req.allowDirectories = true;
        req.createParentDirs = true;
        try {
            engine.copy(req);
            FAIL() << "expected FileOperationError for " << dest;
        } catch (const FileOperationError& e) {
            EXPECT_EQ(e.code(), FileError::InvalidPath) << dest;
        }
        EXPECT_THROW(engine.move(req), FileOperationError) << dest;
    }

    // Only album/one.jpg remains, with no staged copies inside the source
    size_t entries = 0;
    for (const auto& e : fs::recursive_directory_iterator(tmp.join("album"))) {
        (void)e;
        ++entries;
    }
    EXPECT_EQ(entries, 1u);
    EXPECT_EQ(readAllBytes(tmp.join("album/one.jpg")), "1");
}

TEST(AtomicTransfer, SiblingWithSharedPrefixIsNotNested) {
    ScopedTempDir tmp;
    writeFile(tmp.join("album/one.jpg"), "1");

    auto req = request(tmp.str("album"), tmp.str("album2"));
    req.allowDirectories = true;

    AtomicTransferEngine engine;
    engine.copy(req);
    EXPECT_EQ(readAllBytes(tmp.join("album2/one.jpg")), "1");
}
