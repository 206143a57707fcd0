/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Ferry Core project.
 */

#pragma once
#include <cstdint>
#include <optional>
#include <string>

#include "FileUtilities.h"

namespace Ferry::Core::IO {

struct EntryMetadata {
    uint64_t size = 0;
    int64_t modifiedTimeNs = 0;  // since the Unix epoch
};

/**
 * @brief One item produced by DirectoryWalker
 *
 * fullPath, leafName and the type flags come from the directory listing itself. Size and
 * modification time are fetched with a single stat-like call the first time either is
 * requested and cached afterwards; the entry is a snapshot and is not refreshed.
 */
class DirectoryEntry {
public:
    DirectoryEntry(std::string fullPath, std::string leafName, bool isDirectory, bool isSymlink = false)
        : _fullPath(std::move(fullPath))
        , _leafName(std::move(leafName))
        , _isDirectory(isDirectory)
        , _isSymlink(isSymlink) {}

    const std::string& fullPath() const noexcept { return _fullPath; }
    const std::string& leafName() const noexcept { return _leafName; }

    // True for directories and for symlinks that resolve to a directory
    bool isDirectory() const noexcept { return _isDirectory; }
    bool isSymlink() const noexcept { return _isSymlink; }

    /**
     * @brief Lazily fetched size and modification time
     * @throws FileOperationError(TraversalEntry) if the entry can no longer be stat'd
     */
    const EntryMetadata& metadata() const;

    uint64_t size() const { return metadata().size; }
    int64_t modifiedTime(TimeUnits units = TimeUnits::Seconds) const;

    bool operator==(const DirectoryEntry& other) const noexcept {
        return _fullPath == other._fullPath && _isDirectory == other._isDirectory;
    }

private:
    std::string _fullPath;
    std::string _leafName;
    bool _isDirectory;
    bool _isSymlink;
    mutable std::optional<EntryMetadata> _metadata;
};

} // namespace Ferry::Core::IO
