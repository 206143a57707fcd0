/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Ferry Core project.
 */

/**
 * @file ITransferBackend.h
 * @brief Platform primitives behind AtomicTransferEngine
 *
 * A backend performs single-entry operations with the platform's native calls and maps
 * failures into FileOperationError. Policy (identical paths, parent creation, modification
 * time preservation, cross-volume decisions, directory trees) stays in the engine so every
 * backend shares it.
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace Ferry::Core::IO {

/**
 * @brief Options for ITransferBackend::copyFile
 * @param overwrite Replace an existing destination atomically; otherwise fail with DestinationConflict
 * @param chunkSize Streaming buffer size for backends that copy by hand
 * @param tempPrefix Leading characters of temporary sibling names (hidden on POSIX with ".")
 * @param tempTag Marker embedded in temporary names so stray files are recognizable
 */
struct BackendCopyOptions {
    bool overwrite = false;
    size_t chunkSize = 64 * 1024;
    std::string tempPrefix = ".";
    std::string tempTag = "ferry";
};

struct BackendMoveResult {
    uint64_t bytesCopied = 0;         // non-zero only when the move had to copy
    bool copiedAcrossVolumes = false;
};

class ITransferBackend {
public:
    virtual ~ITransferBackend() = default;

    virtual const char* name() const noexcept = 0;

    /**
     * @brief Copies one regular file so the destination appears complete or not at all
     * @return Bytes copied
     * @throws FileOperationError
     */
    virtual uint64_t copyFile(const std::string& source, const std::string& destination,
                              const BackendCopyOptions& options) = 0;

    /**
     * @brief Moves one regular file
     *
     * Same-volume moves are a single rename or link. Across volumes the file is copied and
     * the source deleted when @p allowCrossVolumeCopy is set; otherwise CrossVolume is raised
     * with nothing changed. If the copy succeeded but the source could not be deleted the
     * error carries FileOpStatus::Partial.
     * @throws FileOperationError
     */
    virtual BackendMoveResult moveFile(const std::string& source, const std::string& destination,
                                       bool allowCrossVolumeCopy, const BackendCopyOptions& options) = 0;

    /**
     * @brief Renames a directory within one volume
     *
     * With overwrite=false an existing destination is never replaced. Raises CrossVolume
     * when the platform cannot rename between the two locations.
     * @throws FileOperationError
     */
    virtual void renameDirectory(const std::string& source, const std::string& destination, bool overwrite) = 0;
};

// Backend for the platform this library was built for
std::unique_ptr<ITransferBackend> createPlatformTransferBackend();

} // namespace Ferry::Core::IO
