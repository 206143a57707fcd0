/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Ferry Core project.
 */

#include "DirectoryEntry.h"

#include <cerrno>
#include <filesystem>

#include "FileError.h"

#if defined(_WIN32)
#include <windows.h>
#endif

#if defined(__unix__) || defined(__APPLE__)
#include <sys/stat.h>
#endif

namespace Ferry::Core::IO {

namespace {
    [[noreturn]] void throwStatFailure(const std::string& path, std::error_code ec) {
        auto info = makeFileError(FileError::TraversalEntry, "Failed to read entry metadata", path, ec);
        info.operation = "metadata";
        throw FileOperationError(std::move(info));
    }
}

const EntryMetadata& DirectoryEntry::metadata() const {
    if (_metadata) return *_metadata;

    EntryMetadata meta;
#if defined(_WIN32)
    WIN32_FILE_ATTRIBUTE_DATA data;
    if (!GetFileAttributesExW(std::filesystem::path(_fullPath).wstring().c_str(), GetFileExInfoStandard, &data)) {
        throwStatFailure(_fullPath, std::error_code(static_cast<int>(GetLastError()), std::system_category()));
    }
    ULARGE_INTEGER size;
    size.LowPart = data.nFileSizeLow;
    size.HighPart = data.nFileSizeHigh;
    ULARGE_INTEGER mtime;
    mtime.LowPart = data.ftLastWriteTime.dwLowDateTime;
    mtime.HighPart = data.ftLastWriteTime.dwHighDateTime;
    meta.size = _isDirectory ? 0 : static_cast<uint64_t>(size.QuadPart);
    // FILETIME counts 100ns intervals since 1601-01-01
    meta.modifiedTimeNs = (static_cast<int64_t>(mtime.QuadPart) - 116444736000000000LL) * 100;
#else
    struct stat st;
    int rc = ::stat(_fullPath.c_str(), &st);
    if (rc != 0 && _isSymlink) {
        // Dangling link: describe the link itself
        rc = ::lstat(_fullPath.c_str(), &st);
    }
    if (rc != 0) {
        throwStatFailure(_fullPath, std::error_code(errno, std::generic_category()));
    }
    meta.size = _isDirectory ? 0 : static_cast<uint64_t>(st.st_size);
#if defined(__APPLE__)
    meta.modifiedTimeNs = static_cast<int64_t>(st.st_mtimespec.tv_sec) * 1000000000LL + st.st_mtimespec.tv_nsec;
#else
    meta.modifiedTimeNs = static_cast<int64_t>(st.st_mtim.tv_sec) * 1000000000LL + st.st_mtim.tv_nsec;
#endif
#endif

    _metadata = meta;
    return *_metadata;
}

int64_t DirectoryEntry::modifiedTime(TimeUnits units) const {
    const int64_t ns = metadata().modifiedTimeNs;
    switch (units) {
        case TimeUnits::Seconds: return ns / 1000000000LL;
        case TimeUnits::Milliseconds: return ns / 1000000LL;
        case TimeUnits::Nanoseconds: return ns;
    }
    return ns;
}

} // namespace Ferry::Core::IO
