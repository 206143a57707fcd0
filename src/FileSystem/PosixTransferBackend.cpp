/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Ferry Core project.
 */

#include "PosixTransferBackend.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <vector>

#include <fcntl.h>        // open(), O_*, AT_FDCWD
#include <sys/stat.h>     // fstat(), fchmod(), lstat()
#include <sys/syscall.h>  // SYS_renameat2
#include <unistd.h>       // read(), write(), link(), unlink(), mkstemp()

#include "FileError.h"
#include "PathUtil.h"
#include "Logging/Logger.h"

namespace Ferry::Core::IO {

namespace {
    constexpr const char* kCategory = "PosixTransferBackend";

    [[noreturn]] void throwTransferError(const char* operation, FileError code, std::string message,
                                         const std::string& source, const std::string& destination,
                                         int err = 0, FileOpStatus status = FileOpStatus::Failed) {
        FileErrorInfo info;
        info.code = code;
        info.message = std::move(message);
        info.path = source;
        info.destinationPath = destination;
        info.operation = operation;
        info.status = status;
        if (err != 0) {
            info.systemError = std::error_code(err, std::generic_category());
        }
        throw FileOperationError(std::move(info));
    }

    [[noreturn]] void throwErrnoError(const char* operation, int err, std::string message,
                                 const std::string& source, const std::string& destination) {
        throwTransferError(operation, mapErrnoToFileError(err), std::move(message), source, destination, err);
    }

    [[noreturn]] void throwConflict(const char* operation, const std::string& source, const std::string& destination) {
        throwTransferError(operation, FileError::DestinationConflict, "Destination already exists", source, destination, EEXIST);
    }

    class UniqueFd {
    public:
        explicit UniqueFd(int fd = -1) noexcept : _fd(fd) {}
        ~UniqueFd() {
            if (_fd >= 0) ::close(_fd);
        }
        UniqueFd(const UniqueFd&) = delete;
        UniqueFd& operator=(const UniqueFd&) = delete;

        int get() const noexcept { return _fd; }

        // Closes now and reports close() failures, which can carry deferred write errors
        int close() noexcept {
            int rc = 0;
            if (_fd >= 0) {
                rc = ::close(_fd);
                _fd = -1;
            }
            return rc;
        }

    private:
        int _fd;
    };

    // Best-effort cleanup of an unpublished file
    void discard(const std::string& path) {
        if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
            FERRY_LOG_WARNING_CAT(kCategory, "Failed to remove temporary file " + path + ": " + std::strerror(errno));
        }
    }

    // errno values link() uses for "this filesystem has no hard links"
    bool isLinkUnsupported(int err) noexcept {
        switch (err) {
            case EPERM:
            case EMLINK:
            case ENOSYS:
#if defined(ENOTSUP)
            case ENOTSUP:
#endif
#if defined(EOPNOTSUPP) && defined(ENOTSUP) && (EOPNOTSUPP != ENOTSUP)
            case EOPNOTSUPP:
#endif
                return true;
            default:
                return false;
        }
    }

    // Returns 0 or the errno of the failing write
    int writeFully(int fd, const char* data, size_t len) noexcept {
        while (len > 0) {
            const ssize_t n = ::write(fd, data, len);
            if (n < 0) {
                if (errno == EINTR) continue;
                return errno;
            }
            data += n;
            len -= static_cast<size_t>(n);
        }
        return 0;
    }

    // Streams the rest of in to out in chunkSize pieces. Returns 0 or errno.
    int streamCopy(int in, int out, size_t chunkSize, uint64_t& bytes) {
        std::vector<char> buffer(chunkSize > 0 ? chunkSize : 64 * 1024);
        while (true) {
            const ssize_t n = ::read(in, buffer.data(), buffer.size());
            if (n < 0) {
                if (errno == EINTR) continue;
                return errno;
            }
            if (n == 0) return 0;
            if (int err = writeFully(out, buffer.data(), static_cast<size_t>(n))) return err;
            bytes += static_cast<uint64_t>(n);
        }
    }

    std::string tempTemplate(const std::string& destination, const BackendCopyOptions& options) {
        const std::string name = options.tempPrefix + PathUtil::leafName(destination) + "." + options.tempTag + "-XXXXXX";
        const std::string dir = PathUtil::parent(destination);
        return dir.empty() ? name : PathUtil::join(dir, name);
    }

    // Exclusive-create straight at the destination, for filesystems without hard links
    uint64_t copyExclusive(int srcFd, mode_t mode, const std::string& source, const std::string& destination,
                           const BackendCopyOptions& options) {
        if (::lseek(srcFd, 0, SEEK_SET) < 0) {
            throwErrnoError("copy", errno, "Failed to rewind source", source, destination);
        }

        UniqueFd out(::open(destination.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, mode & 07777));
        if (out.get() < 0) {
            const int err = errno;
            if (err == EEXIST) throwConflict("copy", source, destination);
            throwErrnoError("copy", err, "Failed to create destination", source, destination);
        }

        uint64_t bytes = 0;
        int err = streamCopy(srcFd, out.get(), options.chunkSize, bytes);
        if (err == 0 && ::fchmod(out.get(), mode & 07777) != 0) err = errno;
        if (err == 0 && out.close() != 0) err = errno;
        if (err != 0) {
            out.close();
            discard(destination);
            throwErrnoError("copy", err, "Streaming copy failed", source, destination);
        }
        return bytes;
    }

    // Rename that never replaces an existing destination. Returns 0 or errno.
    int renameNoReplace(const std::string& source, const std::string& destination) {
#if defined(__linux__) && defined(SYS_renameat2) && defined(RENAME_NOREPLACE)
        if (::syscall(SYS_renameat2, AT_FDCWD, source.c_str(), AT_FDCWD, destination.c_str(), RENAME_NOREPLACE) == 0) {
            return 0;
        }
        const int err = errno;
        if (err != ENOSYS && err != EINVAL) {
            return err;
        }
        FERRY_LOG_DEBUG_CAT(kCategory, "renameat2 unsupported here, using checked rename for " + destination);
#endif
        struct stat st;
        if (::lstat(destination.c_str(), &st) == 0) {
            return EEXIST;
        }
        if (::rename(source.c_str(), destination.c_str()) != 0) {
            return errno;
        }
        return 0;
    }
}

uint64_t PosixTransferBackend::copyFile(const std::string& source, const std::string& destination,
                                        const BackendCopyOptions& options) {
    UniqueFd in(::open(source.c_str(), O_RDONLY | O_CLOEXEC));
    if (in.get() < 0) {
        throwErrnoError("copy", errno, "Failed to open source", source, destination);
    }

    struct stat st;
    if (::fstat(in.get(), &st) != 0) {
        throwErrnoError("copy", errno, "Failed to stat source", source, destination);
    }
    if (!S_ISREG(st.st_mode)) {
        throwTransferError("copy", FileError::InvalidPath, "Source is not a regular file", source, destination);
    }

    std::string tmpl = tempTemplate(destination, options);
    std::vector<char> nameBuf(tmpl.begin(), tmpl.end());
    nameBuf.push_back('\0');
    UniqueFd tmp(::mkstemp(nameBuf.data()));
    if (tmp.get() < 0) {
        const int err = errno;
        if (err == ENOENT || err == ENOTDIR) {
            throwTransferError("copy", FileError::InvalidPath, "Destination directory does not exist", source, destination, err);
        }
        throwErrnoError("copy", err, "Failed to create temporary file", source, destination);
    }
    const std::string tmpPath(nameBuf.data());

    uint64_t bytes = 0;
    int err = streamCopy(in.get(), tmp.get(), options.chunkSize, bytes);
    if (err == 0 && ::fchmod(tmp.get(), st.st_mode & 07777) != 0) err = errno;
    if (err == 0 && tmp.close() != 0) err = errno;
    if (err != 0) {
        tmp.close();
        discard(tmpPath);
        throwErrnoError("copy", err, "Streaming copy failed", source, destination);
    }

    if (options.overwrite) {
        if (::rename(tmpPath.c_str(), destination.c_str()) != 0) {
            err = errno;
            discard(tmpPath);
            throwErrnoError("copy", err, "Failed to publish copy", source, destination);
        }
        return bytes;
    }

    if (::link(tmpPath.c_str(), destination.c_str()) == 0) {
        discard(tmpPath);
        return bytes;
    }
    err = errno;
    discard(tmpPath);

    if (err == EEXIST) {
        throwConflict("copy", source, destination);
    }
    if (isLinkUnsupported(err)) {
        FERRY_LOG_DEBUG_CAT(kCategory, "Hard links unavailable, exclusive-create copy to " + destination);
        return copyExclusive(in.get(), st.st_mode, source, destination, options);
    }
    throwErrnoError("copy", err, "Failed to publish copy", source, destination);
}

BackendMoveResult PosixTransferBackend::moveFile(const std::string& source, const std::string& destination,
                                                 bool allowCrossVolumeCopy, const BackendCopyOptions& options) {
    auto crossVolume = [&](int err) -> BackendMoveResult {
        if (!allowCrossVolumeCopy) {
            throwTransferError("move", FileError::CrossVolume, "Source and destination are on different volumes",
                               source, destination, err);
        }
        FERRY_LOG_DEBUG_CAT(kCategory, "Cross-volume move, copying " + source + " to " + destination);

        BackendMoveResult result;
        result.bytesCopied = copyFile(source, destination, options);
        result.copiedAcrossVolumes = true;
        if (::unlink(source.c_str()) != 0) {
            const int unlinkErr = errno;
            throwTransferError("move", FileError::IOError, "Copied across volumes but could not delete the source",
                               source, destination, unlinkErr, FileOpStatus::Partial);
        }
        return result;
    };

    if (options.overwrite) {
        if (::rename(source.c_str(), destination.c_str()) == 0) {
            return {};
        }
        const int err = errno;
        if (err == EXDEV) return crossVolume(err);
        throwErrnoError("move", err, "rename failed", source, destination);
    }

    if (::link(source.c_str(), destination.c_str()) == 0) {
        if (::unlink(source.c_str()) != 0) {
            const int err = errno;
            // Undo the link so the move has no effect
            discard(destination);
            throwErrnoError("move", err, "Failed to remove source after linking destination", source, destination);
        }
        return {};
    }

    int err = errno;
    if (err == EEXIST) throwConflict("move", source, destination);
    if (err == EXDEV) return crossVolume(err);
    if (isLinkUnsupported(err)) {
        err = renameNoReplace(source, destination);
        if (err == 0) return {};
        if (err == EEXIST) throwConflict("move", source, destination);
        if (err == EXDEV) return crossVolume(err);
    }
    throwErrnoError("move", err, "Failed to move file", source, destination);
}

void PosixTransferBackend::renameDirectory(const std::string& source, const std::string& destination, bool overwrite) {
    if (overwrite) {
        if (::rename(source.c_str(), destination.c_str()) != 0) {
            throwErrnoError("move", errno, "Failed to rename directory", source, destination);
        }
        return;
    }

    const int err = renameNoReplace(source, destination);
    if (err == EEXIST) throwConflict("move", source, destination);
    if (err != 0) {
        throwErrnoError("move", err, "Failed to rename directory", source, destination);
    }
}

} // namespace Ferry::Core::IO
