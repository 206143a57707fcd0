/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Ferry Core project.
 */

#include "FileStream.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>

namespace Ferry::Core::IO {

LocalFileStream::LocalFileStream(const std::string& path, StreamMode mode)
    : _path(path), _mode(mode) {
    const auto flags = mode == StreamMode::Read ? std::ios::binary | std::ios::in
                                                : std::ios::binary | std::ios::out | std::ios::trunc;
    _stream.open(path, flags);
    if (!_stream.is_open()) {
        _failFlag = true;
    }
}

LocalFileStream::~LocalFileStream() {
    if (_stream.is_open()) {
        _stream.close();
    }
}

IoResult LocalFileStream::read(std::span<std::byte> buffer) {
    IoResult result;

    if (_failFlag || _mode == StreamMode::Write || _stream.bad()) {
        result.error = FileError::IOError;
        return result;
    }
    if (buffer.empty() || _stream.eof()) {
        result.complete = true;
        return result;
    }

    _stream.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    result.bytesTransferred = static_cast<size_t>(_stream.gcount());
    result.complete = (result.bytesTransferred == buffer.size()) || _stream.eof();

    if (_stream.bad()) {
        result.error = FileError::IOError;
    }

    return result;
}

IoResult LocalFileStream::write(std::span<const std::byte> data) {
    IoResult result;

    if (fail() || _mode == StreamMode::Read) {
        result.error = FileError::IOError;
        return result;
    }
    if (data.empty()) {
        result.complete = true;
        return result;
    }

    _stream.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (_stream.good()) {
        result.bytesTransferred = data.size();
        result.complete = true;
    } else {
        result.error = FileError::IOError;
    }

    return result;
}

void LocalFileStream::close() {
    if (_stream.is_open()) {
        _stream.close();
    }
}

IoResult MemoryFileStream::read(std::span<std::byte> buffer) {
    IoResult result;
    if (_closed) {
        result.error = FileError::IOError;
        return result;
    }

    const size_t available = _data.size() - std::min(_pos, _data.size());
    const size_t toCopy = std::min(available, buffer.size());
    if (toCopy > 0) {
        std::memcpy(buffer.data(), _data.data() + _pos, toCopy);
    }
    _pos += toCopy;

    result.bytesTransferred = toCopy;
    result.complete = (toCopy == buffer.size()) || _pos >= _data.size();
    return result;
}

IoResult MemoryFileStream::write(std::span<const std::byte>) {
    IoResult result;
    result.error = FileError::AccessDenied;
    return result;
}

std::unique_ptr<LocalFileStream> openReadStream(const std::string& path) {
    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (ec || !std::filesystem::exists(status)) {
        auto info = makeFileError(FileError::SourceMissing, "File not found", path, ec ? std::optional(ec) : std::nullopt);
        info.operation = "open";
        throw FileOperationError(std::move(info));
    }
    if (std::filesystem::is_directory(status)) {
        auto info = makeFileError(FileError::InvalidPath, "Path is a directory", path);
        info.operation = "open";
        throw FileOperationError(std::move(info));
    }

    errno = 0;
    auto stream = std::make_unique<LocalFileStream>(path, StreamMode::Read);
    if (!stream->isOpen()) {
        const int err = errno;
        FileErrorInfo info;
        info.code = err != 0 ? mapErrnoToFileError(err) : FileError::IOError;
        info.message = "Failed to open file for reading";
        info.path = path;
        info.operation = "open";
        if (err != 0) info.systemError = std::error_code(err, std::generic_category());
        throw FileOperationError(std::move(info));
    }
    return stream;
}

} // namespace Ferry::Core::IO
