/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Ferry Core project.
 */

#include "AtomicTransferEngine.h"

#include <filesystem>
#include <optional>
#include <random>
#include <stdexcept>

#include "FileError.h"
#include "FileUtilities.h"
#include "PathUtil.h"
#include "CoreCommon.h"
#include "Logging/Logger.h"

#if defined(_WIN32)
#include "WindowsTransferBackend.h"
#else
#include "PosixTransferBackend.h"
#endif

namespace fs = std::filesystem;

namespace Ferry::Core::IO {

namespace {
    constexpr const char* kCategory = "AtomicTransferEngine";
    constexpr int kTempNameAttempts = 16;

    [[noreturn]] void throwRequestError(const char* operation, FileError code, std::string message,
                                        const TransferRequest& request, std::optional<std::error_code> ec = std::nullopt,
                                        FileOpStatus status = FileOpStatus::Failed) {
        FileErrorInfo info;
        info.code = code;
        info.message = std::move(message);
        info.path = request.source;
        info.destinationPath = request.destination;
        info.operation = operation;
        info.systemError = ec;
        info.status = status;
        throw FileOperationError(std::move(info));
    }

    // True when child names a path strictly below parent, after resolving symlinks and dot segments
    bool isStrictlyInside(const std::string& parent, const std::string& child) {
        std::error_code ec;
        const fs::path base = fs::weakly_canonical(parent, ec);
        if (ec) return false;
        const fs::path candidate = fs::weakly_canonical(child, ec);
        if (ec) return false;

        auto b = base.begin();
        auto c = candidate.begin();
        for (; b != base.end() && c != candidate.end(); ++b, ++c) {
            if (b->empty()) break;  // trailing separator
            if (*b != *c) return false;
        }
        if (b != base.end() && !b->empty()) return false;
        return c != candidate.end() && !c->empty();
    }

    // Validates the request and returns the source's status
    fs::file_status checkSource(const char* operation, const TransferRequest& request) {
        if (request.source.empty() || request.destination.empty()) {
            throwRequestError(operation, FileError::InvalidPath, "Source and destination must be non-empty", request);
        }

        std::error_code ec;
        const auto status = fs::status(request.source, ec);
        if (!fs::exists(status)) {
            if (ec && ec != std::errc::no_such_file_or_directory) {
                throwRequestError(operation, mapErrorCodeToFileError(ec), "Failed to stat source", request, ec);
            }
            throwRequestError(operation, FileError::SourceMissing, "Source does not exist", request);
        }
        if (fs::is_directory(status)) {
            if (!request.allowDirectories) {
                throwRequestError(operation, FileError::SourceMissing,
                                  "Source is a directory but allowDirectories is false", request);
            }
            if (isStrictlyInside(request.source, request.destination)) {
                throwRequestError(operation, FileError::InvalidPath,
                                  "Destination lies inside the source directory", request);
            }
        } else if (!fs::is_regular_file(status)) {
            throwRequestError(operation, FileError::InvalidPath, "Source is not a regular file or directory", request);
        }
        return status;
    }

    bool samePath(const std::string& a, const std::string& b) {
        if (a == b) return true;
        if (fs::path(a).lexically_normal() == fs::path(b).lexically_normal()) return true;
        std::error_code ec;
        return fs::equivalent(a, b, ec) && !ec;
    }

    void prepareParent(const TransferRequest& request) {
        if (!request.createParentDirs) return;
        const std::string parent = PathUtil::parent(request.destination);
        if (!parent.empty()) {
            makeDirs(parent);
        }
    }

    std::string randomSuffix() {
        static constexpr char kAlphabet[] = "abcdefghijklmnopqrstuvwxyz0123456789";
        thread_local std::mt19937 rng{std::random_device{}()};
        std::uniform_int_distribution<size_t> pick(0, sizeof(kAlphabet) - 2);
        std::string s(6, '0');
        for (auto& c : s) c = kAlphabet[pick(rng)];
        return s;
    }

    void notifyCrossVolume(const TransferRequest& request) {
        if (request.onCrossVolume) {
            request.onCrossVolume(request.source, request.destination);
        }
        FERRY_LOG_WARNING_CAT(kCategory, "Moving across volumes, retrying with copy: " +
                              request.source + " -> " + request.destination);
    }
}

std::unique_ptr<ITransferBackend> createPlatformTransferBackend() {
#if defined(_WIN32)
    return std::make_unique<WindowsTransferBackend>();
#else
    return std::make_unique<PosixTransferBackend>();
#endif
}

AtomicTransferEngine::Config AtomicTransferEngine::Config::fromEnvironment() {
    Config config;
    if (auto chunk = safeGetEnvByteSize("FERRY_COPY_CHUNK_SIZE")) {
        config.copyChunkSize = *chunk;
    }
    return config;
}

AtomicTransferEngine::AtomicTransferEngine()
    : AtomicTransferEngine(Config{}) {
}

AtomicTransferEngine::AtomicTransferEngine(Config config)
    : AtomicTransferEngine(std::move(config), createPlatformTransferBackend()) {
}

AtomicTransferEngine::AtomicTransferEngine(Config config, std::unique_ptr<ITransferBackend> backend)
    : _config(std::move(config)), _backend(std::move(backend)) {
    if (!_backend) {
        throw std::invalid_argument("AtomicTransferEngine requires a transfer backend");
    }
    if (_config.copyChunkSize == 0) {
        throw std::invalid_argument("AtomicTransferEngine: copyChunkSize must be greater than zero");
    }
}

BackendCopyOptions AtomicTransferEngine::backendOptions(bool overwrite) const {
    BackendCopyOptions options;
    options.overwrite = overwrite;
    options.chunkSize = _config.copyChunkSize;
    options.tempPrefix = _config.tempPrefix;
    options.tempTag = _config.tempTag;
    return options;
}

TransferOutcome AtomicTransferEngine::copy(const TransferRequest& request) {
    const auto sourceStatus = checkSource("copy", request);

    TransferOutcome outcome;
    if (samePath(request.source, request.destination)) {
        FERRY_LOG_DEBUG_CAT(kCategory, "copy: source and destination are the same, nothing to do: " + request.source);
        outcome.noOp = true;
        return outcome;
    }

    prepareParent(request);

    std::optional<int64_t> priorModTime;
    if (request.preserveModTime) {
        std::error_code ec;
        if (fs::exists(request.destination, ec)) {
            priorModTime = getLastModTime(request.destination, TimeUnits::Nanoseconds);
        }
    }

    if (fs::is_directory(sourceStatus)) {
        outcome.bytesTransferred = copyDirectory(request.source, request.destination, request.overwrite);
    } else {
        outcome.bytesTransferred = _backend->copyFile(request.source, request.destination,
                                                      backendOptions(request.overwrite));
    }

    if (priorModTime) {
        setLastModTime(request.destination, *priorModTime, TimeUnits::Nanoseconds);
    }

    FERRY_LOG_DEBUG_CAT(kCategory, "copy via " + std::string(_backend->name()) + ": " + request.source + " -> " +
                        request.destination + " (" + std::to_string(outcome.bytesTransferred) + " bytes)");
    return outcome;
}

TransferOutcome AtomicTransferEngine::move(const TransferRequest& request) {
    const auto sourceStatus = checkSource("move", request);

    TransferOutcome outcome;
    if (samePath(request.source, request.destination)) {
        FERRY_LOG_DEBUG_CAT(kCategory, "move: source and destination are the same, nothing to do: " + request.source);
        outcome.noOp = true;
        return outcome;
    }

    prepareParent(request);

    const CrossVolumePolicy policy = request.crossVolumePolicy.value_or(_config.defaultCrossVolumePolicy);

    if (!fs::is_directory(sourceStatus)) {
        std::error_code sizeEc;
        const auto size = fs::file_size(request.source, sizeEc);

        const auto options = backendOptions(request.overwrite);
        BackendMoveResult result;
        try {
            result = _backend->moveFile(request.source, request.destination,
                                        policy == CrossVolumePolicy::Allow, options);
        } catch (const FileOperationError& e) {
            if (e.code() != FileError::CrossVolume || policy != CrossVolumePolicy::NotifyThenAllow) {
                throw;
            }
            notifyCrossVolume(request);
            result = _backend->moveFile(request.source, request.destination, true, options);
        }

        outcome.bytesTransferred = sizeEc ? result.bytesCopied : static_cast<uint64_t>(size);
        outcome.usedCrossVolumeFallback = result.copiedAcrossVolumes;
    } else {
        try {
            publishDirectory(request.source, request.destination, request.overwrite);
        } catch (const FileOperationError& e) {
            if (e.code() != FileError::CrossVolume || policy == CrossVolumePolicy::Fail) {
                throw;
            }
            if (policy == CrossVolumePolicy::NotifyThenAllow) {
                notifyCrossVolume(request);
            }

            outcome.bytesTransferred = copyDirectory(request.source, request.destination, request.overwrite);
            outcome.usedCrossVolumeFallback = true;

            std::error_code ec;
            fs::remove_all(request.source, ec);
            if (ec) {
                throwRequestError("move", FileError::IOError,
                                  "Copied directory across volumes but could not delete the source",
                                  request, ec, FileOpStatus::Partial);
            }
        }
    }

    if (outcome.usedCrossVolumeFallback) {
        FERRY_LOG_WARNING_CAT(kCategory, "move completed by copy and delete: " + request.source + " -> " +
                              request.destination);
    } else {
        FERRY_LOG_DEBUG_CAT(kCategory, "move via " + std::string(_backend->name()) + ": " + request.source +
                            " -> " + request.destination);
    }
    return outcome;
}

std::string AtomicTransferEngine::makeTempSibling(const std::string& destination, const char* purpose,
                                                  bool createDirectory) {
    const std::string parent = PathUtil::parent(destination);
    const std::string base = _config.tempPrefix + PathUtil::leafName(destination) + "." + _config.tempTag +
                             "-" + purpose + "-";

    for (int attempt = 0; attempt < kTempNameAttempts; ++attempt) {
        const std::string name = base + randomSuffix();
        const std::string candidate = parent.empty() ? name : PathUtil::join(parent, name);

        std::error_code ec;
        if (createDirectory) {
            if (fs::create_directory(candidate, ec)) {
                return candidate;
            }
            if (ec && ec != std::errc::file_exists) {
                auto info = makeFileError(mapErrorCodeToFileError(ec), "Failed to create temporary directory",
                                          candidate, ec);
                info.operation = "copy";
                throw FileOperationError(std::move(info));
            }
        } else if (!fs::exists(fs::symlink_status(candidate, ec))) {
            return candidate;
        }
    }

    auto info = makeFileError(FileError::IOError, "Could not find a free temporary name", destination);
    info.operation = "copy";
    throw FileOperationError(std::move(info));
}

uint64_t AtomicTransferEngine::copyTree(const std::string& source, const std::string& destination) {
    uint64_t bytes = 0;
    std::error_code ec;

    for (fs::directory_iterator it(source, ec), end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        const std::string from = PathUtil::join(source, name);
        const std::string to = PathUtil::join(destination, name);

        std::error_code typeEc;
        if (it->is_symlink(typeEc)) {
            fs::copy_symlink(from, to, typeEc);
            if (typeEc) {
                auto info = makeFileError(mapErrorCodeToFileError(typeEc), "Failed to copy symlink", from, typeEc);
                info.destinationPath = to;
                info.operation = "copy";
                throw FileOperationError(std::move(info));
            }
        } else if (it->is_directory(typeEc)) {
            fs::create_directory(to, from, typeEc);
            if (typeEc) {
                auto info = makeFileError(mapErrorCodeToFileError(typeEc), "Failed to create directory", to, typeEc);
                info.operation = "copy";
                throw FileOperationError(std::move(info));
            }
            bytes += copyTree(from, to);
        } else if (it->is_regular_file(typeEc)) {
            bytes += _backend->copyFile(from, to, backendOptions(false));
        } else {
            FERRY_LOG_WARNING_CAT(kCategory, "Skipping special file during directory copy: " + from);
        }
    }

    if (ec) {
        auto info = makeFileError(mapErrorCodeToFileError(ec), "Failed to read directory", source, ec);
        info.destinationPath = destination;
        info.operation = "copy";
        throw FileOperationError(std::move(info));
    }
    return bytes;
}

uint64_t AtomicTransferEngine::copyDirectory(const std::string& source, const std::string& destination,
                                             bool overwrite) {
    std::error_code ec;
    if (!overwrite && fs::exists(fs::symlink_status(destination, ec))) {
        auto info = makeFileError(FileError::DestinationConflict, "Destination already exists", source);
        info.destinationPath = destination;
        info.operation = "copy";
        throw FileOperationError(std::move(info));
    }

    // Build the whole tree under a hidden sibling, then publish it with one rename
    const std::string staged = makeTempSibling(destination, "dir", true);
    uint64_t bytes = 0;
    try {
        const auto sourcePerms = fs::status(source, ec).permissions();
        if (!ec) {
            fs::permissions(staged, sourcePerms, ec);
        }
        bytes = copyTree(source, staged);
        publishDirectory(staged, destination, overwrite);
    } catch (...) {
        std::error_code cleanupEc;
        fs::remove_all(staged, cleanupEc);
        if (cleanupEc) {
            FERRY_LOG_WARNING_CAT(kCategory, "Failed to remove staged copy " + staged + ": " + cleanupEc.message());
        }
        throw;
    }
    return bytes;
}

void AtomicTransferEngine::publishDirectory(const std::string& staged, const std::string& destination,
                                            bool overwrite) {
    std::error_code ec;
    const auto destStatus = fs::symlink_status(destination, ec);
    if (!overwrite || !fs::exists(destStatus) || !fs::is_directory(destStatus)) {
        _backend->renameDirectory(staged, destination, overwrite);
        return;
    }

    // Replace an existing directory: park it, rename the new one in, then drop the old one
    const std::string parked = makeTempSibling(destination, "old", false);
    _backend->renameDirectory(destination, parked, false);
    try {
        _backend->renameDirectory(staged, destination, false);
    } catch (const FileOperationError& publishError) {
        try {
            _backend->renameDirectory(parked, destination, false);
        } catch (const FileOperationError& restoreError) {
            FileErrorInfo info;
            info.code = FileError::IOError;
            info.message = "Failed to publish the new directory (" + publishError.info().message +
                           ") and could not restore the previous one, which remains at " + parked;
            info.path = parked;
            info.destinationPath = destination;
            info.operation = "copy";
            info.systemError = restoreError.info().systemError;
            info.status = FileOpStatus::Partial;
            FERRY_LOG_ERROR_CAT(kCategory, info.message);
            throw FileOperationError(std::move(info));
        }
        throw;
    }

    fs::remove_all(parked, ec);
    if (ec) {
        FERRY_LOG_WARNING_CAT(kCategory, "Replaced " + destination + " but could not remove the previous copy at " +
                              parked + ": " + ec.message());
    }
}

} // namespace Ferry::Core::IO
