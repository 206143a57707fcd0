/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Ferry Core project.
 */

#include "WindowsTransferBackend.h"

#if defined(_WIN32)

#include <filesystem>

#include <windows.h>

#include "FileError.h"

namespace Ferry::Core::IO {

namespace {
    [[noreturn]] void throwWin32Error(const char* operation, DWORD err, std::string message,
                                      const std::string& source, const std::string& destination) {
        FileErrorInfo info;
        info.code = mapWin32ToFileError(err);
        info.message = std::move(message);
        info.path = source;
        info.destinationPath = destination;
        info.operation = operation;
        info.systemError = std::error_code(static_cast<int>(err), std::system_category());
        throw FileOperationError(std::move(info));
    }

    std::wstring widen(const std::string& path) {
        return std::filesystem::path(path).wstring();
    }

    uint64_t fileSize(const std::wstring& path) {
        WIN32_FILE_ATTRIBUTE_DATA data;
        if (!GetFileAttributesExW(path.c_str(), GetFileExInfoStandard, &data)) {
            return 0;
        }
        ULARGE_INTEGER size;
        size.LowPart = data.nFileSizeLow;
        size.HighPart = data.nFileSizeHigh;
        return static_cast<uint64_t>(size.QuadPart);
    }

    // Volume mount point containing path, for deciding whether a move had to copy
    std::wstring volumeOf(const std::wstring& path) {
        wchar_t buffer[MAX_PATH + 1] = {};
        const std::wstring absolute = std::filesystem::absolute(std::filesystem::path(path)).wstring();
        if (!GetVolumePathNameW(absolute.c_str(), buffer, MAX_PATH + 1)) {
            return {};
        }
        return buffer;
    }
}

uint64_t WindowsTransferBackend::copyFile(const std::string& source, const std::string& destination,
                                          const BackendCopyOptions& options) {
    const std::wstring wsrc = widen(source);
    const std::wstring wdst = widen(destination);

    const BOOL failIfExists = options.overwrite ? FALSE : TRUE;
    if (!CopyFileW(wsrc.c_str(), wdst.c_str(), failIfExists)) {
        throwWin32Error("copy", GetLastError(), "CopyFileW failed", source, destination);
    }
    return fileSize(wdst);
}

BackendMoveResult WindowsTransferBackend::moveFile(const std::string& source, const std::string& destination,
                                                   bool allowCrossVolumeCopy, const BackendCopyOptions& options) {
    const std::wstring wsrc = widen(source);
    const std::wstring wdst = widen(destination);

    DWORD flags = MOVEFILE_WRITE_THROUGH;
    if (options.overwrite) flags |= MOVEFILE_REPLACE_EXISTING;
    if (allowCrossVolumeCopy) flags |= MOVEFILE_COPY_ALLOWED;

    BackendMoveResult result;
    if (allowCrossVolumeCopy) {
        const std::wstring srcVolume = volumeOf(wsrc);
        result.copiedAcrossVolumes = !srcVolume.empty() && srcVolume != volumeOf(wdst);
        if (result.copiedAcrossVolumes) {
            result.bytesCopied = fileSize(wsrc);
        }
    }

    if (!MoveFileExW(wsrc.c_str(), wdst.c_str(), flags)) {
        throwWin32Error("move", GetLastError(), "MoveFileExW failed", source, destination);
    }
    return result;
}

void WindowsTransferBackend::renameDirectory(const std::string& source, const std::string& destination, bool overwrite) {
    const std::wstring wsrc = widen(source);
    const std::wstring wdst = widen(destination);

    DWORD flags = 0;
    if (overwrite) flags |= MOVEFILE_REPLACE_EXISTING;
    if (!MoveFileExW(wsrc.c_str(), wdst.c_str(), flags)) {
        throwWin32Error("move", GetLastError(), "MoveFileExW failed for directory", source, destination);
    }
}

} // namespace Ferry::Core::IO

#endif // _WIN32
