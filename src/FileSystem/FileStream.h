/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Ferry Core project.
 */

#pragma once
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <memory>
#include <optional>
#include <span>
#include <string>

#include "FileError.h"

namespace Ferry::Core::IO {

// Outcome of a single read or write call
struct IoResult {
    size_t bytesTransferred = 0;
    bool complete = false;
    std::optional<FileError> error;

    bool success() const { return !error.has_value(); }
};

/**
 * @brief Sequential byte source or sink
 *
 * HashEngine drains any FileStream; the local implementation also backs the whole-file
 * helpers in FileUtilities.
 */
class FileStream {
public:
    virtual ~FileStream() = default;

    // Reads up to buffer.size() bytes; 0 bytes with no error means end of stream
    virtual IoResult read(std::span<std::byte> buffer) = 0;
    virtual IoResult write(std::span<const std::byte> data) = 0;

    virtual bool fail() const = 0;
    virtual void close() = 0;

    // Path used in error reports, empty for in-memory streams
    virtual std::string path() const { return {}; }
};

enum class StreamMode { Read, Write };

// Binary std::fstream over a local file. Write mode truncates.
class LocalFileStream : public FileStream {
public:
    LocalFileStream(const std::string& path, StreamMode mode);
    ~LocalFileStream() override;

    IoResult read(std::span<std::byte> buffer) override;
    IoResult write(std::span<const std::byte> data) override;
    bool fail() const override { return _stream.fail() || _failFlag; }
    void close() override;
    std::string path() const override { return _path; }

    void flush() { _stream.flush(); }
    bool isOpen() const { return _stream.is_open() && !_failFlag; }

private:
    std::fstream _stream;
    std::string _path;
    StreamMode _mode;
    bool _failFlag = false;
};

/**
 * @brief Read-only FileStream over caller-owned memory
 *
 * The stream does not copy the bytes; the caller keeps them alive for the stream's lifetime.
 */
class MemoryFileStream : public FileStream {
public:
    explicit MemoryFileStream(std::span<const std::byte> data) : _data(data) {}

    IoResult read(std::span<std::byte> buffer) override;
    IoResult write(std::span<const std::byte> data) override;
    bool fail() const override { return _closed; }
    void close() override { _closed = true; }

private:
    std::span<const std::byte> _data;
    size_t _pos = 0;
    bool _closed = false;
};

/**
 * @brief Opens a local file for reading
 * @throws FileOperationError (SourceMissing, AccessDenied, InvalidPath or IOError) when the
 *         file cannot be opened
 */
std::unique_ptr<LocalFileStream> openReadStream(const std::string& path);

} // namespace Ferry::Core::IO
