/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Ferry Core project.
 */

/**
 * @file AtomicTransferEngine.h
 * @brief Copy and move with explicit overwrite semantics and all-or-nothing results
 *
 * The engine owns the policy shared by every platform: request validation, the identical-path
 * no-op, parent directory creation, modification time preservation, recursive directory
 * copies and the cross-volume decision for moves. The platform calls themselves live behind
 * ITransferBackend.
 *
 * Guarantees:
 * - overwrite=false never alters or removes an existing destination
 * - a destination is either fully written or absent; partial data only ever exists under a
 *   hidden temporary sibling name
 * - a cross-volume move is the one non-atomic case: the copy completes before the source is
 *   deleted, and a failed delete is reported with FileOpStatus::Partial
 *
 * @code
 * AtomicTransferEngine engine;
 * TransferRequest req;
 * req.source = "/data/in/report.pdf";
 * req.destination = "/data/out/report.pdf";
 * req.createParentDirs = true;
 * try {
 *     engine.copy(req);
 * } catch (const FileOperationError& e) {
 *     if (e.code() == FileError::DestinationConflict) { ... }
 * }
 * @endcode
 */
#pragma once
#include <cstddef>
#include <memory>
#include <string>

#include "ITransferBackend.h"
#include "TransferRequest.h"

namespace Ferry::Core::IO {

class AtomicTransferEngine {
public:
    /**
     * @brief Engine-wide defaults
     * @param copyChunkSize Streaming buffer for hand-rolled copies
     * @param defaultCrossVolumePolicy Used when a request does not set crossVolumePolicy
     * @param tempPrefix Leading characters of temporary sibling names
     * @param tempTag Marker embedded in temporary sibling names
     */
    struct Config {
        size_t copyChunkSize = 64 * 1024;
        CrossVolumePolicy defaultCrossVolumePolicy = CrossVolumePolicy::Allow;
        std::string tempPrefix = ".";
        std::string tempTag = "ferry";

        // Defaults overridden by FERRY_COPY_CHUNK_SIZE (bytes, K/M suffix accepted)
        static Config fromEnvironment();
    };

    AtomicTransferEngine();
    explicit AtomicTransferEngine(Config config);

    // Injects a backend, e.g. one that simulates another volume in tests
    AtomicTransferEngine(Config config, std::unique_ptr<ITransferBackend> backend);

    AtomicTransferEngine(const AtomicTransferEngine&) = delete;
    AtomicTransferEngine& operator=(const AtomicTransferEngine&) = delete;

    /**
     * @brief Copies request.source to request.destination
     * @throws FileOperationError SourceMissing, DestinationConflict, AccessDenied, DiskFull,
     *         InvalidPath or IOError with both paths attached
     */
    TransferOutcome copy(const TransferRequest& request);

    /**
     * @brief Moves request.source to request.destination
     *
     * Falls back to copy-then-delete across volumes according to the request's
     * CrossVolumePolicy (or the configured default).
     * @throws FileOperationError as copy(), plus CrossVolume under CrossVolumePolicy::Fail
     */
    TransferOutcome move(const TransferRequest& request);

    const Config& config() const noexcept { return _config; }
    ITransferBackend& backend() noexcept { return *_backend; }

private:
    uint64_t copyDirectory(const std::string& source, const std::string& destination, bool overwrite);
    uint64_t copyTree(const std::string& source, const std::string& destination);
    void publishDirectory(const std::string& staged, const std::string& destination, bool overwrite);
    std::string makeTempSibling(const std::string& destination, const char* purpose, bool createDirectory);
    BackendCopyOptions backendOptions(bool overwrite) const;

    Config _config;
    std::unique_ptr<ITransferBackend> _backend;
};

} // namespace Ferry::Core::IO
