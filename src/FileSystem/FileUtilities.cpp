/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Ferry Core project.
 */

#include "FileUtilities.h"

#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>

#include "FileError.h"
#include "FileStream.h"
#include "Logging/Logger.h"

#if defined(_WIN32)
#include <windows.h>
#endif

#if defined(__unix__) || defined(__APPLE__)
#include <fcntl.h>     // AT_FDCWD
#include <sys/stat.h>  // stat(), utimensat()
#endif

namespace fs = std::filesystem;

namespace Ferry::Core::IO {

namespace {
    constexpr size_t kCompareChunkSize = 64 * 1024;
    constexpr int64_t kNanosPerSecond = 1000000000LL;
    constexpr int64_t kNanosPerMilli = 1000000LL;

    [[noreturn]] void fail(const char* operation, FileError code, std::string message,
                           const std::string& path, std::optional<std::error_code> ec = std::nullopt) {
        auto info = makeFileError(code, std::move(message), path, ec);
        info.operation = operation;
        throw FileOperationError(std::move(info));
    }

    [[noreturn]] void failFromErrorCode(const char* operation, std::string message,
                                        const std::string& path, const std::error_code& ec) {
        fail(operation, mapErrorCodeToFileError(ec), std::move(message), path, ec);
    }

    int64_t toNanos(int64_t value, TimeUnits units) noexcept {
        switch (units) {
            case TimeUnits::Seconds: return value * kNanosPerSecond;
            case TimeUnits::Milliseconds: return value * kNanosPerMilli;
            case TimeUnits::Nanoseconds: return value;
        }
        return value;
    }

    int64_t fromNanos(int64_t nanos, TimeUnits units) noexcept {
        switch (units) {
            case TimeUnits::Seconds: return nanos / kNanosPerSecond;
            case TimeUnits::Milliseconds: return nanos / kNanosPerMilli;
            case TimeUnits::Nanoseconds: return nanos;
        }
        return nanos;
    }

#if defined(_WIN32)
    // FILETIME counts 100ns intervals since 1601-01-01
    constexpr int64_t kEpochDifference100ns = 116444736000000000LL;

    int64_t fileTimeToUnixNanos(const FILETIME& ft) noexcept {
        ULARGE_INTEGER v;
        v.LowPart = ft.dwLowDateTime;
        v.HighPart = ft.dwHighDateTime;
        return (static_cast<int64_t>(v.QuadPart) - kEpochDifference100ns) * 100;
    }

    FILETIME unixNanosToFileTime(int64_t nanos) noexcept {
        ULARGE_INTEGER v;
        v.QuadPart = static_cast<ULONGLONG>(nanos / 100 + kEpochDifference100ns);
        FILETIME ft;
        ft.dwLowDateTime = v.LowPart;
        ft.dwHighDateTime = v.HighPart;
        return ft;
    }
#endif

    int64_t readModTimeNanos(const std::string& path) {
#if defined(_WIN32)
        WIN32_FILE_ATTRIBUTE_DATA data;
        if (!GetFileAttributesExW(fs::path(path).wstring().c_str(), GetFileExInfoStandard, &data)) {
            const DWORD err = GetLastError();
            fail("getLastModTime", mapWin32ToFileError(err), "Failed to query file attributes", path,
                 std::error_code(static_cast<int>(err), std::system_category()));
        }
        return fileTimeToUnixNanos(data.ftLastWriteTime);
#else
        struct stat st;
        if (::stat(path.c_str(), &st) != 0) {
            const int err = errno;
            fail("getLastModTime", mapErrnoToFileError(err), "stat failed", path,
                 std::error_code(err, std::generic_category()));
        }
#if defined(__APPLE__)
        return static_cast<int64_t>(st.st_mtimespec.tv_sec) * kNanosPerSecond + st.st_mtimespec.tv_nsec;
#else
        return static_cast<int64_t>(st.st_mtim.tv_sec) * kNanosPerSecond + st.st_mtim.tv_nsec;
#endif
#endif
    }

    void writeModTimeNanos(const std::string& path, int64_t nanos) {
#if defined(_WIN32)
        HANDLE h = CreateFileW(fs::path(path).wstring().c_str(), FILE_WRITE_ATTRIBUTES,
                               FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE, nullptr,
                               OPEN_EXISTING, FILE_FLAG_BACKUP_SEMANTICS, nullptr);
        if (h == INVALID_HANDLE_VALUE) {
            const DWORD err = GetLastError();
            fail("setLastModTime", mapWin32ToFileError(err), "Failed to open for attribute update", path,
                 std::error_code(static_cast<int>(err), std::system_category()));
        }
        const FILETIME ft = unixNanosToFileTime(nanos);
        // Null creation/access pointers leave those times unchanged
        const BOOL ok = SetFileTime(h, nullptr, nullptr, &ft);
        const DWORD err = ok ? 0 : GetLastError();
        CloseHandle(h);
        if (!ok) {
            fail("setLastModTime", mapWin32ToFileError(err), "SetFileTime failed", path,
                 std::error_code(static_cast<int>(err), std::system_category()));
        }
#else
        struct timespec times[2];
        times[0].tv_sec = 0;
        times[0].tv_nsec = UTIME_OMIT;  // keep access time
        times[1].tv_sec = static_cast<time_t>(nanos / kNanosPerSecond);
        times[1].tv_nsec = static_cast<long>(nanos % kNanosPerSecond);
        if (times[1].tv_nsec < 0) {
            times[1].tv_nsec += kNanosPerSecond;
            times[1].tv_sec -= 1;
        }
        if (::utimensat(AT_FDCWD, path.c_str(), times, 0) != 0) {
            const int err = errno;
            fail("setLastModTime", mapErrnoToFileError(err), "utimensat failed", path,
                 std::error_code(err, std::generic_category()));
        }
#endif
    }

    bool contentMatches(const std::string& path, std::span<const std::byte> data) {
        std::error_code ec;
        const auto size = fs::file_size(path, ec);
        if (ec || size != data.size()) return false;
        if (data.empty()) return true;
        const auto existing = readAll(path);
        return std::memcmp(existing.data(), data.data(), data.size()) == 0;
    }
}

void makeDirs(const std::string& path) {
    std::error_code ec;
    if (fs::is_directory(path, ec)) return;

    fs::create_directories(path, ec);
    if (ec) {
        // A concurrent creator may have won the race
        std::error_code statEc;
        if (fs::is_directory(path, statEc)) return;
        const FileError code = (ec == std::errc::file_exists || ec == std::errc::not_a_directory)
            ? FileError::InvalidPath : mapErrorCodeToFileError(ec);
        fail("makeDirs", code, "Failed to create directory", path, ec);
    }
    if (!fs::is_directory(path, ec)) {
        fail("makeDirs", FileError::InvalidPath, "Path is occupied by a non-directory", path);
    }
}

void ensureEmptyDirectory(const std::string& path) {
    std::error_code ec;
    const auto status = fs::symlink_status(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        failFromErrorCode("ensureEmptyDirectory", "Failed to stat path", path, ec);
    }

    if (fs::exists(status) && !fs::is_directory(status)) {
        fail("ensureEmptyDirectory", FileError::InvalidPath, "A file exists at this location", path);
    }

    if (!fs::exists(status)) {
        makeDirs(path);
        return;
    }

    size_t removed = 0;
    for (fs::directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec)) {
        const auto child = it->path();
        std::error_code rmEc;
        fs::remove_all(child, rmEc);
        if (rmEc) {
            failFromErrorCode("ensureEmptyDirectory", "Failed to delete child", child.string(), rmEc);
        }
        ++removed;
    }
    if (ec) {
        failFromErrorCode("ensureEmptyDirectory", "Failed to list directory", path, ec);
    }
    if (!isEmptyDir(path)) {
        fail("ensureEmptyDirectory", FileError::IOError, "Directory is not empty after clearing", path);
    }
    if (removed > 0) {
        FERRY_LOG_DEBUG_CAT("FileUtilities", "Cleared " + std::to_string(removed) + " entries from " + path);
    }
}

void deleteFile(const std::string& path) {
    std::error_code ec;
    const auto status = fs::symlink_status(path, ec);
    if (!fs::exists(status)) {
        fail("deleteFile", FileError::SourceMissing, "File not found", path);
    }
    if (fs::is_directory(status)) {
        fail("deleteFile", FileError::InvalidPath, "Path is a directory", path);
    }
    if (!fs::remove(path, ec) || ec) {
        if (ec) failFromErrorCode("deleteFile", "Failed to delete file", path, ec);
        fail("deleteFile", FileError::IOError, "Failed to delete file", path);
    }
}

void deleteSure(const std::string& path) {
    std::error_code ec;
    if (fs::exists(fs::symlink_status(path, ec))) {
        deleteFile(path);
    }
    if (fs::exists(fs::symlink_status(path, ec))) {
        fail("deleteSure", FileError::IOError, "File still present after delete", path);
    }
}

bool isEmptyDir(const std::string& path) {
    std::error_code ec;
    fs::directory_iterator it(path, ec);
    if (ec) {
        failFromErrorCode("isEmptyDir", "Failed to open directory", path, ec);
    }
    return it == fs::directory_iterator();
}

bool fileContentsEqual(const std::string& a, const std::string& b) {
    std::error_code ecA, ecB;
    const auto sizeA = fs::file_size(a, ecA);
    if (ecA) failFromErrorCode("fileContentsEqual", "Failed to query size", a, ecA);
    const auto sizeB = fs::file_size(b, ecB);
    if (ecB) failFromErrorCode("fileContentsEqual", "Failed to query size", b, ecB);
    if (sizeA != sizeB) return false;

    auto streamA = openReadStream(a);
    auto streamB = openReadStream(b);
    std::vector<std::byte> bufA(kCompareChunkSize);
    std::vector<std::byte> bufB(kCompareChunkSize);

    while (true) {
        auto ra = streamA->read(bufA);
        auto rb = streamB->read(bufB);
        if (!ra.success()) fail("fileContentsEqual", *ra.error, "Read failed", a);
        if (!rb.success()) fail("fileContentsEqual", *rb.error, "Read failed", b);
        if (ra.bytesTransferred != rb.bytesTransferred) return false;
        if (ra.bytesTransferred == 0) return true;
        if (std::memcmp(bufA.data(), bufB.data(), ra.bytesTransferred) != 0) return false;
    }
}

std::vector<std::byte> readAll(const std::string& path) {
    auto stream = openReadStream(path);
    std::vector<std::byte> out;
    std::array<std::byte, kCompareChunkSize> chunk;
    while (true) {
        auto r = stream->read(chunk);
        if (!r.success()) fail("readAll", *r.error, "Read failed", path);
        if (r.bytesTransferred == 0) break;
        out.insert(out.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(r.bytesTransferred));
    }
    return out;
}

std::string readAllText(const std::string& path) {
    auto bytes = readAll(path);
    return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

bool writeAll(const std::string& path, std::span<const std::byte> data, const WriteAllOptions& options) {
    std::error_code ec;
    if (options.skipIfSameContent && fs::is_regular_file(path, ec) && contentMatches(path, data)) {
        if (options.updateTimeIfSameContent) {
            const auto now = std::chrono::duration_cast<std::chrono::nanoseconds>(
                std::chrono::system_clock::now().time_since_epoch()).count();
            setLastModTime(path, static_cast<int64_t>(now), TimeUnits::Nanoseconds);
        }
        return false;
    }

    errno = 0;
    LocalFileStream stream(path, StreamMode::Write);
    if (!stream.isOpen()) {
        const int err = errno;
        fail("writeAll", err != 0 ? mapErrnoToFileError(err) : FileError::IOError,
             "Failed to open file for writing", path,
             err != 0 ? std::optional(std::error_code(err, std::generic_category())) : std::nullopt);
    }
    auto r = stream.write(data);
    stream.flush();
    if (!r.success() || stream.fail()) {
        fail("writeAll", r.error.value_or(FileError::IOError), "Write failed", path);
    }
    stream.close();
    return true;
}

bool writeAll(const std::string& path, std::string_view text, const WriteAllOptions& options) {
    return writeAll(path, std::as_bytes(std::span<const char>(text.data(), text.size())), options);
}

int64_t getLastModTime(const std::string& path, TimeUnits units) {
    return fromNanos(readModTimeNanos(path), units);
}

void setLastModTime(const std::string& path, int64_t value, TimeUnits units) {
    writeModTimeNanos(path, toNanos(value, units));
}

} // namespace Ferry::Core::IO
