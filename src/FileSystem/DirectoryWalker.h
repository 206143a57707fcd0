/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Ferry Core project.
 */

/**
 * @file DirectoryWalker.h
 * @brief Single-level listing and lazy depth-first traversal of local directories
 *
 * Listing order is lexicographic by leaf name, except on Windows where the filesystem's own
 * stable order is kept. Recursion is top-down: a directory is produced (when directories are
 * requested) before its files, and its files before any of its subdirectories are entered,
 * so a directory predicate can prune a subtree before it is read.
 *
 * @code
 * TraversalFilter filter;
 * filter.setAllowedExtensions({"txt", ".MD"});
 * filter.directoryPredicate = [](const std::string& dir) { return PathUtil::leafName(dir) != ".git"; };
 *
 * auto onError = [](const std::string& path, const FileErrorInfo& err) {
 *     FERRY_LOG_WARNING("Skipping " + path + ": " + err.message);
 * };
 * for (const auto& entry : DirectoryWalker::recurseFiles("/srv/data", filter, onError)) {
 *     process(entry.fullPath());
 * }
 * @endcode
 */
#pragma once
#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "DirectoryEntry.h"
#include "FileError.h"

namespace Ferry::Core::IO {

using DirectoryPredicate = std::function<bool(const std::string& directoryPath)>;

/**
 * @brief Receives per-entry traversal failures; the failing subtree is skipped
 */
using TraversalErrorHandler = std::function<void(const std::string& path, const FileErrorInfo& error)>;

/**
 * @brief Selection rules shared by listing and recursion
 * @param allowedExtensions When set, only entries whose extension is in the set are produced
 * @param directoryPredicate Decides both descent into and reporting of each subdirectory
 * @param followSymlinks Descend into symlinked directories (they are reported either way)
 * @param includeFiles Produce non-directory entries
 * @param includeDirectories Produce directory entries (the root included when recursing)
 */
struct TraversalFilter {
    std::optional<std::set<std::string>> allowedExtensions;
    DirectoryPredicate directoryPredicate;
    bool followSymlinks = false;
    bool includeFiles = true;
    bool includeDirectories = true;

    // Stores extensions normalized: no leading dot, lowercase
    TraversalFilter& setAllowedExtensions(std::initializer_list<std::string_view> extensions);
    TraversalFilter& setAllowedExtensions(const std::vector<std::string>& extensions);

    bool acceptsExtension(std::string_view path) const;
    bool acceptsDirectory(const std::string& path) const;
};

/**
 * @brief Lazy, single-pass sequence of entries from a recursive walk
 *
 * Iterating reads directories on demand. Errors from the root are raised when the walk is
 * created; later failures go to the error handler, or propagate from operator++ as
 * FileOperationError(TraversalEntry) when no handler was given. Call recurseFiles/recurseDirs
 * again to restart.
 */
class DirectoryWalker {
public:
    class Iterator {
    public:
        using iterator_concept = std::input_iterator_tag;
        using iterator_category = std::input_iterator_tag;
        using value_type = DirectoryEntry;
        using difference_type = std::ptrdiff_t;
        using pointer = const DirectoryEntry*;
        using reference = const DirectoryEntry&;

        Iterator() = default;
        explicit Iterator(DirectoryWalker* walker) : _walker(walker) {}

        reference operator*() const { return *_walker->_current; }
        pointer operator->() const { return &*_walker->_current; }
        Iterator& operator++() {
            _walker->advance();
            return *this;
        }
        void operator++(int) { ++*this; }

        bool operator==(std::default_sentinel_t) const noexcept {
            return !_walker || !_walker->_current.has_value();
        }

    private:
        DirectoryWalker* _walker = nullptr;
    };

    DirectoryWalker(const DirectoryWalker&) = delete;
    DirectoryWalker& operator=(const DirectoryWalker&) = delete;
    DirectoryWalker(DirectoryWalker&&);
    DirectoryWalker& operator=(DirectoryWalker&&);
    ~DirectoryWalker();

    Iterator begin() { return Iterator(this); }
    std::default_sentinel_t end() const noexcept { return std::default_sentinel; }

    /**
     * @brief Entries directly inside @p directory that pass @p filter
     * @throws FileOperationError if the directory is missing, not a directory or unreadable
     */
    static std::vector<DirectoryEntry> listChildren(const std::string& directory, const TraversalFilter& filter = {});
    static std::vector<DirectoryEntry> listFiles(const std::string& directory, const TraversalFilter& filter = {});
    static std::vector<DirectoryEntry> listDirs(const std::string& directory, const TraversalFilter& filter = {});

    // Files under root, recursively (filter.includeFiles/includeDirectories are overridden)
    static DirectoryWalker recurseFiles(const std::string& root, const TraversalFilter& filter = {},
                                        TraversalErrorHandler onError = {});

    // Directories under root, recursively, starting with root itself
    static DirectoryWalker recurseDirs(const std::string& root, const TraversalFilter& filter = {},
                                       TraversalErrorHandler onError = {});

    // Recursive walk honoring filter.includeFiles and filter.includeDirectories as given
    static DirectoryWalker walk(const std::string& root, const TraversalFilter& filter = {},
                                TraversalErrorHandler onError = {});

private:
    struct Frame;

    DirectoryWalker(const std::string& root, TraversalFilter filter, TraversalErrorHandler onError,
                    const char* operation);

    void advance();
    bool shouldYield(const DirectoryEntry& entry) const;
    bool enterDirectory(const DirectoryEntry& directory);
    void reportEntryError(const std::string& path, FileErrorInfo info);

    TraversalFilter _filter;
    TraversalErrorHandler _onError;
    std::string _operation;
    std::vector<Frame> _stack;
    std::vector<DirectoryEntry> _pending;  // entries ready to yield, consumed front to back
    size_t _pendingPos = 0;
    std::optional<DirectoryEntry> _current;
};

} // namespace Ferry::Core::IO
