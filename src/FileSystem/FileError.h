/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Ferry Core project.
 */

#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace Ferry::Core::IO {

enum class FileOpStatus { Complete, Partial, Failed };

/**
 * Public error taxonomy surfaced by transfer, traversal and hashing operations.
 * Mapping guidelines:
 * - SourceMissing: copy/move source does not exist, or is a directory when directories are disallowed
 * - DestinationConflict: destination exists and overwrite was not requested
 * - CrossVolume: rename impossible because source and destination are on different volumes
 * - AccessDenied: permission or lock conflict reported by the platform (not retried)
 * - DiskFull: ENOSPC/EDQUOT or equivalent on write
 * - InvalidPath: malformed path, name too long, parent missing or occupied by a file
 * - IOError: other local I/O failures
 * - TraversalEntry: an entry could not be read or stat'd during recursion
 * - UnknownAlgorithm: hash identifier not recognized (raised before any I/O)
 */
enum class FileError {
    None = 0,
    SourceMissing,
    DestinationConflict,
    CrossVolume,
    AccessDenied,
    DiskFull,
    InvalidPath,
    IOError,
    TraversalEntry,
    UnknownAlgorithm,
    Unknown
};

std::string_view fileErrorToString(FileError code) noexcept;

struct FileErrorInfo {
    FileError code = FileError::None;
    std::string message;
    std::optional<std::error_code> systemError;
    std::string path;
    std::string destinationPath;  // second path for two-path operations (copy/move)
    std::string operation;        // "copy", "move", "listChildren", "computeHash", ...
    FileOpStatus status = FileOpStatus::Failed;

    bool ok() const noexcept { return code == FileError::None; }
};

/**
 * @brief Exception thrown by FerryCore operations
 *
 * what() is a diagnostic string built from the operation, paths, message and platform
 * error. Callers that need structure should use info().
 */
class FileOperationError : public std::runtime_error {
public:
    explicit FileOperationError(FileErrorInfo info);

    FileError code() const noexcept { return _info.code; }
    const FileErrorInfo& info() const noexcept { return _info; }

private:
    FileErrorInfo _info;
};

// Map errno to FileError with platform-specific handling
FileError mapErrnoToFileError(int err) noexcept;

#if defined(_WIN32)
// Map GetLastError() codes to FileError
FileError mapWin32ToFileError(unsigned long err) noexcept;
#endif

// Map a std::error_code produced by std::filesystem or a platform call
FileError mapErrorCodeToFileError(const std::error_code& ec) noexcept;

/**
 * @brief Builds a FileErrorInfo describing a failed operation
 */
FileErrorInfo makeFileError(FileError code,
                            std::string message,
                            std::string path = {},
                            std::optional<std::error_code> ec = std::nullopt);

[[noreturn]] void throwFileError(FileError code,
                                 std::string message,
                                 std::string path = {},
                                 std::optional<std::error_code> ec = std::nullopt);

} // namespace Ferry::Core::IO
