/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Ferry Core project.
 */

/**
 * @file ferry_file_ops_c.cpp
 * @brief Implementation of the transfer, hashing and traversal C API
 */

#include <new>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "CApiErrorState.h"
#include "FileSystem/AtomicTransferEngine.h"
#include "FileSystem/DirectoryWalker.h"
#include "FileSystem/FileError.h"
#include "Hashing/HashEngine.h"
#include "Logging/CLogger.h"
#include "ferry/ferry_file_ops.h"

using namespace Ferry::Core::IO;
using Ferry::Core::Hashing::HashEngine;
namespace CApi = Ferry::Core::CApi;

/* ============================================================================
 * Exception Translation
 * ============================================================================ */

static FerryFileError to_c_file_error(FileError code) {
    switch (code) {
        case FileError::None: return FERRY_FILE_ERROR_NONE;
        case FileError::SourceMissing: return FERRY_FILE_ERROR_SOURCE_MISSING;
        case FileError::DestinationConflict: return FERRY_FILE_ERROR_CONFLICT;
        case FileError::CrossVolume: return FERRY_FILE_ERROR_CROSS_VOLUME;
        case FileError::AccessDenied: return FERRY_FILE_ERROR_ACCESS_DENIED;
        case FileError::DiskFull: return FERRY_FILE_ERROR_DISK_FULL;
        case FileError::InvalidPath: return FERRY_FILE_ERROR_INVALID_PATH;
        case FileError::IOError: return FERRY_FILE_ERROR_IO_ERROR;
        case FileError::TraversalEntry: return FERRY_FILE_ERROR_TRAVERSAL_ENTRY;
        case FileError::UnknownAlgorithm: return FERRY_FILE_ERROR_UNKNOWN_ALGORITHM;
        case FileError::Unknown: return FERRY_FILE_ERROR_UNKNOWN;
    }
    return FERRY_FILE_ERROR_UNKNOWN;
}

static FerryStatus to_c_status(FerryFileError error) {
    switch (error) {
        case FERRY_FILE_ERROR_NONE: return FERRY_OK;
        case FERRY_FILE_ERROR_SOURCE_MISSING: return static_cast<FerryStatus>(FERRY_ERR_FILE_SOURCE_MISSING);
        case FERRY_FILE_ERROR_CONFLICT: return static_cast<FerryStatus>(FERRY_ERR_FILE_CONFLICT);
        case FERRY_FILE_ERROR_CROSS_VOLUME: return static_cast<FerryStatus>(FERRY_ERR_FILE_CROSS_VOLUME);
        case FERRY_FILE_ERROR_ACCESS_DENIED: return static_cast<FerryStatus>(FERRY_ERR_FILE_ACCESS_DENIED);
        case FERRY_FILE_ERROR_DISK_FULL: return static_cast<FerryStatus>(FERRY_ERR_FILE_DISK_FULL);
        case FERRY_FILE_ERROR_INVALID_PATH: return static_cast<FerryStatus>(FERRY_ERR_FILE_INVALID_PATH);
        case FERRY_FILE_ERROR_IO_ERROR: return static_cast<FerryStatus>(FERRY_ERR_FILE_IO_ERROR);
        case FERRY_FILE_ERROR_TRAVERSAL_ENTRY: return static_cast<FerryStatus>(FERRY_ERR_FILE_TRAVERSAL);
        case FERRY_FILE_ERROR_UNKNOWN_ALGORITHM:
            return static_cast<FerryStatus>(FERRY_ERR_FILE_UNKNOWN_ALGORITHM);
        default: return FERRY_ERR_UNKNOWN;
    }
}

static void translate_exception(FerryStatus* status) {
    try {
        throw;
    } catch (const FileOperationError& e) {
        const FerryFileError error = to_c_file_error(e.code());
        CApi::setLastError(error, e.what());
        if (status) *status = to_c_status(error);
    } catch (const std::bad_alloc&) {
        CApi::setLastError(FERRY_FILE_ERROR_UNKNOWN, "out of memory");
        if (status) *status = FERRY_ERR_NO_MEMORY;
    } catch (const std::invalid_argument& e) {
        CApi::setLastError(FERRY_FILE_ERROR_NONE, e.what());
        if (status) *status = FERRY_ERR_INVALID_ARG;
    } catch (const std::exception& e) {
        CApi::setLastError(FERRY_FILE_ERROR_UNKNOWN, e.what());
        if (status) *status = FERRY_ERR_UNKNOWN;
    } catch (...) {
        CApi::setLastError(FERRY_FILE_ERROR_UNKNOWN, "unknown exception");
        if (status) *status = FERRY_ERR_UNKNOWN;
    }
}

static void fail_invalid_arg(FerryStatus* status, const char* message) {
    CApi::setLastError(FERRY_FILE_ERROR_NONE, message);
    *status = FERRY_ERR_INVALID_ARG;
}

/* ============================================================================
 * Type Conversions
 * ============================================================================ */

static TransferRequest to_cpp_request(const FerryTransferRequest* req) {
    TransferRequest r;
    r.source = req->source;
    r.destination = req->destination;
    r.overwrite = req->overwrite != FERRY_FALSE;
    r.allowDirectories = req->allow_directories != FERRY_FALSE;
    r.createParentDirs = req->create_parent_dirs != FERRY_FALSE;
    r.preserveModTime = req->preserve_mod_time != FERRY_FALSE;

    switch (req->cross_volume_policy) {
        case FERRY_CROSS_VOLUME_ALLOW:
            r.crossVolumePolicy = CrossVolumePolicy::Allow;
            break;
        case FERRY_CROSS_VOLUME_NOTIFY_THEN_ALLOW:
            r.crossVolumePolicy = CrossVolumePolicy::NotifyThenAllow;
            break;
        case FERRY_CROSS_VOLUME_FAIL:
            r.crossVolumePolicy = CrossVolumePolicy::Fail;
            break;
        default:
            break;
    }

    if (req->on_cross_volume) {
        auto callback = req->on_cross_volume;
        void* userData = req->user_data;
        r.onCrossVolume = [callback, userData](const std::string& src, const std::string& dst) {
            callback(src.c_str(), dst.c_str(), userData);
        };
    }
    return r;
}

static void to_c_outcome(const TransferOutcome& outcome, FerryTransferOutcome* out) {
    if (!out) return;
    out->bytes_transferred = outcome.bytesTransferred;
    out->no_op = outcome.noOp ? FERRY_TRUE : FERRY_FALSE;
    out->used_cross_volume_fallback = outcome.usedCrossVolumeFallback ? FERRY_TRUE : FERRY_FALSE;
}

static TraversalFilter to_cpp_filter(const FerryTraversalOptions* opts) {
    TraversalFilter filter;
    if (!opts) return filter;

    if (opts->allowed_extensions) {
        std::vector<std::string> extensions;
        extensions.reserve(opts->allowed_extension_count);
        for (size_t i = 0; i < opts->allowed_extension_count; ++i) {
            if (opts->allowed_extensions[i]) extensions.emplace_back(opts->allowed_extensions[i]);
        }
        filter.setAllowedExtensions(extensions);
    }
    filter.followSymlinks = opts->follow_symlinks != FERRY_FALSE;
    filter.includeFiles = opts->include_files != FERRY_FALSE;
    filter.includeDirectories = opts->include_directories != FERRY_FALSE;
    if (opts->directory_predicate) {
        const FerryDirectoryPredicate predicate = opts->directory_predicate;
        void* user_data = opts->user_data;
        filter.directoryPredicate = [predicate, user_data](const std::string& dir) {
            return predicate(dir.c_str(), user_data) != FERRY_FALSE;
        };
    }
    return filter;
}

// Empty unless the caller asked to skip unreadable entries, so the walk fails otherwise
static TraversalErrorHandler to_cpp_error_handler(const FerryTraversalOptions* opts) {
    if (!opts || !opts->on_error) return {};

    const FerryTraversalErrorCallback callback = opts->on_error;
    void* user_data = opts->user_data;
    return [callback, user_data](const std::string& path, const FileErrorInfo& error) {
        FERRY_LOG_DEBUG_CAT_F("ferry_c_api", "Skipping unreadable entry %s: %s", path.c_str(),
                              error.message.c_str());
        callback(path.c_str(), to_c_file_error(error.code), error.message.c_str(), user_data);
    };
}

static bool emit(const DirectoryEntry& entry, FerryEntryCallback callback, void* user_data) {
    return callback(entry.fullPath().c_str(), entry.leafName().c_str(),
                    entry.isDirectory() ? FERRY_TRUE : FERRY_FALSE, user_data) != FERRY_FALSE;
}

/* ============================================================================
 * Transfers
 * ============================================================================ */

extern "C" {

void ferry_transfer_request_init(FerryTransferRequest* request) {
    if (!request) return;

    request->source = NULL;
    request->destination = NULL;
    request->overwrite = FERRY_FALSE;
    request->allow_directories = FERRY_FALSE;
    request->create_parent_dirs = FERRY_FALSE;
    request->preserve_mod_time = FERRY_FALSE;
    request->cross_volume_policy = FERRY_CROSS_VOLUME_DEFAULT;
    request->on_cross_volume = NULL;
    request->user_data = NULL;
}

void ferry_traversal_options_init(FerryTraversalOptions* options) {
    if (!options) return;

    options->allowed_extensions = NULL;
    options->allowed_extension_count = 0;
    options->follow_symlinks = FERRY_FALSE;
    options->include_files = FERRY_TRUE;
    options->include_directories = FERRY_TRUE;
    options->directory_predicate = NULL;
    options->on_error = NULL;
    options->user_data = NULL;
}

void ferry_copy(const FerryTransferRequest* request, FerryTransferOutcome* out_outcome, FerryStatus* status) {
    if (!status) return;
    if (!request || !request->source || !request->destination) {
        fail_invalid_arg(status, "ferry_copy: request, source and destination are required");
        return;
    }

    try {
        AtomicTransferEngine engine(AtomicTransferEngine::Config::fromEnvironment());
        to_c_outcome(engine.copy(to_cpp_request(request)), out_outcome);
        CApi::clearLastError();
        *status = FERRY_OK;
    } catch (...) {
        translate_exception(status);
    }
}

void ferry_move(const FerryTransferRequest* request, FerryTransferOutcome* out_outcome, FerryStatus* status) {
    if (!status) return;
    if (!request || !request->source || !request->destination) {
        fail_invalid_arg(status, "ferry_move: request, source and destination are required");
        return;
    }

    try {
        AtomicTransferEngine engine(AtomicTransferEngine::Config::fromEnvironment());
        to_c_outcome(engine.move(to_cpp_request(request)), out_outcome);
        CApi::clearLastError();
        *status = FERRY_OK;
    } catch (...) {
        translate_exception(status);
    }
}

/* ============================================================================
 * Hashing
 * ============================================================================ */

void ferry_compute_hash_file(const char* path, const char* algorithm, size_t buffer_size,
                             FerryOwnedString* out_digest, FerryStatus* status) {
    if (!status) return;
    if (!path || !algorithm || !out_digest) {
        fail_invalid_arg(status, "ferry_compute_hash_file: path, algorithm and out_digest are required");
        return;
    }

    try {
        const size_t chunk = buffer_size != 0 ? buffer_size : HashEngine::kDefaultBufferSize;
        const std::string digest = HashEngine::computeHash(std::string(path), std::string_view(algorithm), chunk);
        *status = CApi::copyStringOut(digest, out_digest);
        if (*status == FERRY_OK) CApi::clearLastError();
    } catch (...) {
        translate_exception(status);
    }
}

void ferry_compute_hash_bytes(const uint8_t* data, size_t len, const char* algorithm,
                              FerryOwnedString* out_digest, FerryStatus* status) {
    if (!status) return;
    if ((!data && len > 0) || !algorithm || !out_digest) {
        fail_invalid_arg(status, "ferry_compute_hash_bytes: data, algorithm and out_digest are required");
        return;
    }

    try {
        const auto bytes = std::as_bytes(std::span<const uint8_t>(data, len));
        const std::string digest = HashEngine::computeHashBytes(bytes, std::string_view(algorithm));
        *status = CApi::copyStringOut(digest, out_digest);
        if (*status == FERRY_OK) CApi::clearLastError();
    } catch (...) {
        translate_exception(status);
    }
}

/* ============================================================================
 * Traversal
 * ============================================================================ */

void ferry_list_children(const char* directory, const FerryTraversalOptions* options,
                         FerryEntryCallback callback, void* user_data, FerryStatus* status) {
    if (!status) return;
    if (!directory || !callback) {
        fail_invalid_arg(status, "ferry_list_children: directory and callback are required");
        return;
    }

    try {
        for (const auto& entry : DirectoryWalker::listChildren(directory, to_cpp_filter(options))) {
            if (!emit(entry, callback, user_data)) break;
        }
        CApi::clearLastError();
        *status = FERRY_OK;
    } catch (...) {
        translate_exception(status);
    }
}

void ferry_recurse_files(const char* root, const FerryTraversalOptions* options,
                         FerryEntryCallback callback, void* user_data, FerryStatus* status) {
    if (!status) return;
    if (!root || !callback) {
        fail_invalid_arg(status, "ferry_recurse_files: root and callback are required");
        return;
    }

    try {
        auto walker = DirectoryWalker::recurseFiles(root, to_cpp_filter(options), to_cpp_error_handler(options));
        for (const auto& entry : walker) {
            if (!emit(entry, callback, user_data)) break;
        }
        CApi::clearLastError();
        *status = FERRY_OK;
    } catch (...) {
        translate_exception(status);
    }
}

void ferry_recurse_dirs(const char* root, const FerryTraversalOptions* options,
                        FerryEntryCallback callback, void* user_data, FerryStatus* status) {
    if (!status) return;
    if (!root || !callback) {
        fail_invalid_arg(status, "ferry_recurse_dirs: root and callback are required");
        return;
    }

    try {
        auto walker = DirectoryWalker::recurseDirs(root, to_cpp_filter(options), to_cpp_error_handler(options));
        for (const auto& entry : walker) {
            if (!emit(entry, callback, user_data)) break;
        }
        CApi::clearLastError();
        *status = FERRY_OK;
    } catch (...) {
        translate_exception(status);
    }
}

/* ============================================================================
 * Diagnostics
 * ============================================================================ */

const char* ferry_file_error_to_string(FerryFileError error) {
    switch (error) {
        case FERRY_FILE_ERROR_NONE:
            return "None";
        case FERRY_FILE_ERROR_SOURCE_MISSING:
            return "SourceMissing";
        case FERRY_FILE_ERROR_CONFLICT:
            return "DestinationConflict";
        case FERRY_FILE_ERROR_CROSS_VOLUME:
            return "CrossVolume";
        case FERRY_FILE_ERROR_ACCESS_DENIED:
            return "AccessDenied";
        case FERRY_FILE_ERROR_DISK_FULL:
            return "DiskFull";
        case FERRY_FILE_ERROR_INVALID_PATH:
            return "InvalidPath";
        case FERRY_FILE_ERROR_IO_ERROR:
            return "IOError";
        case FERRY_FILE_ERROR_TRAVERSAL_ENTRY:
            return "TraversalEntry";
        case FERRY_FILE_ERROR_UNKNOWN_ALGORITHM:
            return "UnknownAlgorithm";
        case FERRY_FILE_ERROR_UNKNOWN:
            return "Unknown";
        default:
            return "Unknown";
    }
}

}  // extern "C"
