/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Ferry Core project.
 */

/**
 * @file FileUtilities.h
 * @brief Synchronous helpers for common local file chores
 *
 * Every function here reports failure by throwing FileOperationError with the path and the
 * platform error attached. None of them retry.
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace Ferry::Core::IO {

enum class TimeUnits { Seconds, Milliseconds, Nanoseconds };

struct WriteAllOptions {
    bool skipIfSameContent = false;       // Leave the file alone if it already holds exactly these bytes
    bool updateTimeIfSameContent = true;  // When skipping, still bump the modification time to now
};

/**
 * @brief Creates a directory and any missing parents
 *
 * Succeeds if the directory already exists.
 * @throws FileOperationError(InvalidPath) if a non-directory occupies the path or a parent
 */
void makeDirs(const std::string& path);

/**
 * @brief Leaves @p path as an existing, empty directory
 *
 * Deletes every child (recursively for subdirectories) if the directory exists, otherwise
 * creates it. Calling it twice in a row is harmless.
 * @throws FileOperationError(InvalidPath) if a file exists at @p path
 */
void ensureEmptyDirectory(const std::string& path);

// Unlinks a file. Throws if it is missing, is a directory, or cannot be removed.
void deleteFile(const std::string& path);

// Deletes the file if present, then confirms it is gone
void deleteSure(const std::string& path);

bool isEmptyDir(const std::string& path);

/**
 * @brief Byte-for-byte comparison of two files, streamed in fixed chunks
 */
bool fileContentsEqual(const std::string& a, const std::string& b);

std::vector<std::byte> readAll(const std::string& path);
std::string readAllText(const std::string& path);

/**
 * @brief Writes the whole file, truncating any previous content
 * @return false if the write was skipped because the content already matched
 */
bool writeAll(const std::string& path, std::span<const std::byte> data, const WriteAllOptions& options = {});
bool writeAll(const std::string& path, std::string_view text, const WriteAllOptions& options = {});

/**
 * @brief Last modification time since the Unix epoch, truncated to @p units
 */
int64_t getLastModTime(const std::string& path, TimeUnits units = TimeUnits::Seconds);

/**
 * @brief Sets the modification time, keeping the access time unchanged
 */
void setLastModTime(const std::string& path, int64_t value, TimeUnits units = TimeUnits::Seconds);

} // namespace Ferry::Core::IO
