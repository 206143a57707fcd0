/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Ferry Core project.
 */

#include "FileError.h"

#include <cerrno>

#if defined(_WIN32)
#include <windows.h>
#endif

namespace Ferry::Core::IO {

namespace {
    std::string describe(const FileErrorInfo& info) {
        std::string s;
        if (!info.operation.empty()) {
            s += info.operation + ": ";
        }
        s += info.message.empty() ? std::string(fileErrorToString(info.code)) : info.message;
        if (!info.path.empty()) {
            s += " [" + info.path;
            if (!info.destinationPath.empty()) {
                s += " -> " + info.destinationPath;
            }
            s += "]";
        }
        if (info.systemError) {
            s += " (err=" + std::to_string(info.systemError->value()) + ": " + info.systemError->message() + ")";
        }
        return s;
    }
}

std::string_view fileErrorToString(FileError code) noexcept {
    switch (code) {
        case FileError::None: return "None";
        case FileError::SourceMissing: return "SourceMissing";
        case FileError::DestinationConflict: return "DestinationConflict";
        case FileError::CrossVolume: return "CrossVolume";
        case FileError::AccessDenied: return "AccessDenied";
        case FileError::DiskFull: return "DiskFull";
        case FileError::InvalidPath: return "InvalidPath";
        case FileError::IOError: return "IOError";
        case FileError::TraversalEntry: return "TraversalEntry";
        case FileError::UnknownAlgorithm: return "UnknownAlgorithm";
        case FileError::Unknown: return "Unknown";
    }
    return "Unknown";
}

FileOperationError::FileOperationError(FileErrorInfo info)
    : std::runtime_error(describe(info)), _info(std::move(info)) {
}

FileError mapErrnoToFileError(int err) noexcept {
    switch (err) {
        case ENOSPC:
#if defined(__unix__) || defined(__APPLE__)
        case EDQUOT:  // Disk quota exceeded (POSIX)
#endif
            return FileError::DiskFull;
        case EACCES:
        case EPERM:
#if defined(__unix__) || defined(__APPLE__)
        case ETXTBSY:
#endif
            return FileError::AccessDenied;
        case ENOENT:
            return FileError::SourceMissing;
        case EEXIST:
        case ENOTEMPTY:
            return FileError::DestinationConflict;
        case EXDEV:
            return FileError::CrossVolume;
        case EINVAL:
        case ENAMETOOLONG:
        case ENOTDIR:
        case EISDIR:
#if defined(__unix__) || defined(__APPLE__)
        case ELOOP:
#endif
            return FileError::InvalidPath;
        default:
            return FileError::IOError;
    }
}

#if defined(_WIN32)
FileError mapWin32ToFileError(unsigned long err) noexcept {
    switch (err) {
        case ERROR_FILE_NOT_FOUND:
        case ERROR_PATH_NOT_FOUND:
            return FileError::SourceMissing;
        case ERROR_ACCESS_DENIED:
        case ERROR_SHARING_VIOLATION:
        case ERROR_LOCK_VIOLATION:
            return FileError::AccessDenied;
        case ERROR_NOT_SAME_DEVICE:
            return FileError::CrossVolume;
        case ERROR_FILE_EXISTS:
        case ERROR_ALREADY_EXISTS:
            return FileError::DestinationConflict;
        case ERROR_DISK_FULL:
        case ERROR_HANDLE_DISK_FULL:
            return FileError::DiskFull;
        case ERROR_INVALID_NAME:
        case ERROR_FILENAME_EXCED_RANGE:
        case ERROR_DIRECTORY:
            return FileError::InvalidPath;
        default:
            return FileError::IOError;
    }
}
#endif

FileError mapErrorCodeToFileError(const std::error_code& ec) noexcept {
    if (!ec) return FileError::None;
#if defined(_WIN32)
    if (ec.category() == std::system_category()) {
        return mapWin32ToFileError(static_cast<unsigned long>(ec.value()));
    }
#endif
    return mapErrnoToFileError(ec.value());
}

FileErrorInfo makeFileError(FileError code, std::string message, std::string path, std::optional<std::error_code> ec) {
    FileErrorInfo info;
    info.code = code;
    info.message = std::move(message);
    info.path = std::move(path);
    info.systemError = ec;
    return info;
}

void throwFileError(FileError code, std::string message, std::string path, std::optional<std::error_code> ec) {
    throw FileOperationError(makeFileError(code, std::move(message), std::move(path), ec));
}

} // namespace Ferry::Core::IO
