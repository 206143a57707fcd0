/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Ferry Core project.
 */

#include "DirectoryWalker.h"

#include <algorithm>
#include <filesystem>

#include "PathUtil.h"
#include "Logging/Logger.h"

namespace fs = std::filesystem;

namespace Ferry::Core::IO {

struct DirectoryWalker::Frame {
    std::vector<DirectoryEntry> subdirectories;  // already accepted by the predicate
    size_t next = 0;
    std::string canonicalPath;                   // only tracked when following symlinks
};

namespace {
    // Reads one directory level. Returns false and sets ec if the directory cannot be read.
    bool readDirectory(const std::string& directory, std::vector<DirectoryEntry>& out, std::error_code& ec) {
        out.clear();
        fs::directory_iterator it(directory, ec);
        if (ec) return false;

        for (fs::directory_iterator end; it != end; it.increment(ec)) {
            if (ec) return false;
            const auto& fsEntry = *it;
            std::string name = fsEntry.path().filename().string();

            // Type queries on a dangling symlink fail; such entries are reported as non-directories
            std::error_code typeEc;
            const bool isSymlink = fsEntry.is_symlink(typeEc);
            const bool isDirectory = fsEntry.is_directory(typeEc);

            out.emplace_back(PathUtil::join(directory, name), std::move(name), isDirectory, isSymlink);
        }
        if (ec) return false;

#if !defined(_WIN32)
        std::sort(out.begin(), out.end(), [](const DirectoryEntry& a, const DirectoryEntry& b) {
            return a.leafName() < b.leafName();
        });
#endif
        return true;
    }

    TraversalFilter normalized(TraversalFilter filter) {
        if (filter.allowedExtensions) {
            std::set<std::string> clean;
            for (const auto& ext : *filter.allowedExtensions) {
                clean.insert(PathUtil::normalizeExtension(ext));
            }
            filter.allowedExtensions = std::move(clean);
        }
        return filter;
    }

    // Validates a root/listing directory; failures here always propagate
    void requireDirectory(const std::string& directory, const char* operation) {
        std::error_code ec;
        const auto status = fs::status(directory, ec);
        FileErrorInfo info;
        info.path = directory;
        info.operation = operation;
        if (!fs::exists(status)) {
            info.code = FileError::SourceMissing;
            info.message = "Directory not found";
            if (ec && ec != std::errc::no_such_file_or_directory) {
                info.code = mapErrorCodeToFileError(ec);
                info.message = "Failed to stat directory";
                info.systemError = ec;
            }
            throw FileOperationError(std::move(info));
        }
        if (!fs::is_directory(status)) {
            info.code = FileError::InvalidPath;
            info.message = "Not a directory";
            throw FileOperationError(std::move(info));
        }
    }

    [[noreturn]] void throwUnreadableRoot(const std::string& directory, const char* operation, const std::error_code& ec) {
        auto info = makeFileError(mapErrorCodeToFileError(ec), "Failed to read directory", directory, ec);
        info.operation = operation;
        throw FileOperationError(std::move(info));
    }
}

TraversalFilter& TraversalFilter::setAllowedExtensions(std::initializer_list<std::string_view> extensions) {
    std::set<std::string> set;
    for (auto ext : extensions) {
        set.insert(PathUtil::normalizeExtension(ext));
    }
    allowedExtensions = std::move(set);
    return *this;
}

TraversalFilter& TraversalFilter::setAllowedExtensions(const std::vector<std::string>& extensions) {
    std::set<std::string> set;
    for (const auto& ext : extensions) {
        set.insert(PathUtil::normalizeExtension(ext));
    }
    allowedExtensions = std::move(set);
    return *this;
}

bool TraversalFilter::acceptsExtension(std::string_view path) const {
    if (!allowedExtensions) return true;
    return allowedExtensions->count(PathUtil::extension(path, true)) > 0;
}

bool TraversalFilter::acceptsDirectory(const std::string& path) const {
    return !directoryPredicate || directoryPredicate(path);
}

// ---- Single-level listing ----

std::vector<DirectoryEntry> DirectoryWalker::listChildren(const std::string& directory, const TraversalFilter& filter) {
    requireDirectory(directory, "listChildren");

    std::vector<DirectoryEntry> all;
    std::error_code ec;
    if (!readDirectory(directory, all, ec)) {
        throwUnreadableRoot(directory, "listChildren", ec);
    }

    const TraversalFilter f = normalized(filter);
    std::vector<DirectoryEntry> result;
    result.reserve(all.size());
    for (auto& entry : all) {
        if (entry.isDirectory()) {
            if (!f.includeDirectories || !f.acceptsDirectory(entry.fullPath())) continue;
        } else if (!f.includeFiles) {
            continue;
        }
        if (!f.acceptsExtension(entry.leafName())) continue;
        result.push_back(std::move(entry));
    }
    return result;
}

std::vector<DirectoryEntry> DirectoryWalker::listFiles(const std::string& directory, const TraversalFilter& filter) {
    TraversalFilter f = filter;
    f.includeFiles = true;
    f.includeDirectories = false;
    return listChildren(directory, f);
}

std::vector<DirectoryEntry> DirectoryWalker::listDirs(const std::string& directory, const TraversalFilter& filter) {
    TraversalFilter f = filter;
    f.includeFiles = false;
    f.includeDirectories = true;
    return listChildren(directory, f);
}

// ---- Recursive walk ----

DirectoryWalker DirectoryWalker::recurseFiles(const std::string& root, const TraversalFilter& filter,
                                              TraversalErrorHandler onError) {
    TraversalFilter f = filter;
    f.includeFiles = true;
    f.includeDirectories = false;
    return DirectoryWalker(root, std::move(f), std::move(onError), "recurseFiles");
}

DirectoryWalker DirectoryWalker::recurseDirs(const std::string& root, const TraversalFilter& filter,
                                             TraversalErrorHandler onError) {
    TraversalFilter f = filter;
    f.includeFiles = false;
    f.includeDirectories = true;
    return DirectoryWalker(root, std::move(f), std::move(onError), "recurseDirs");
}

DirectoryWalker DirectoryWalker::walk(const std::string& root, const TraversalFilter& filter,
                                      TraversalErrorHandler onError) {
    return DirectoryWalker(root, filter, std::move(onError), "walk");
}

DirectoryWalker::DirectoryWalker(const std::string& root, TraversalFilter filter, TraversalErrorHandler onError,
                                 const char* operation)
    : _filter(normalized(std::move(filter)))
    , _onError(std::move(onError))
    , _operation(operation) {
    requireDirectory(root, operation);

    std::error_code ec;
    fs::path rootPath(root);
    DirectoryEntry rootEntry(root, rootPath.filename().string(), true, fs::is_symlink(fs::symlink_status(rootPath, ec)));

    if (shouldYield(rootEntry)) {
        _pending.push_back(rootEntry);
    }

    // The root is always entered, even if it is itself a symlink
    std::vector<DirectoryEntry> children;
    if (!readDirectory(root, children, ec)) {
        throwUnreadableRoot(root, operation, ec);
    }

    Frame frame;
    if (_filter.followSymlinks) {
        frame.canonicalPath = fs::weakly_canonical(rootPath, ec).string();
    }
    for (auto& child : children) {
        if (child.isDirectory()) {
            if (_filter.acceptsDirectory(child.fullPath())) {
                frame.subdirectories.push_back(std::move(child));
            }
        } else if (shouldYield(child)) {
            _pending.push_back(std::move(child));
        }
    }
    _stack.push_back(std::move(frame));

    advance();
}

DirectoryWalker::DirectoryWalker(DirectoryWalker&&) = default;
DirectoryWalker& DirectoryWalker::operator=(DirectoryWalker&&) = default;
DirectoryWalker::~DirectoryWalker() = default;

bool DirectoryWalker::shouldYield(const DirectoryEntry& entry) const {
    if (entry.isDirectory() ? !_filter.includeDirectories : !_filter.includeFiles) {
        return false;
    }
    return _filter.acceptsExtension(entry.leafName());
}

void DirectoryWalker::reportEntryError(const std::string& path, FileErrorInfo info) {
    info.code = FileError::TraversalEntry;
    info.path = path;
    info.operation = _operation;
    if (!_onError) {
        throw FileOperationError(std::move(info));
    }
    FERRY_LOG_DEBUG_CAT("DirectoryWalker", "Skipping subtree " + path + ": " + info.message);
    _onError(path, info);
}

bool DirectoryWalker::enterDirectory(const DirectoryEntry& directory) {
    if (directory.isSymlink() && !_filter.followSymlinks) {
        return false;
    }

    Frame frame;
    std::error_code ec;
    if (_filter.followSymlinks) {
        frame.canonicalPath = fs::weakly_canonical(directory.fullPath(), ec).string();
        if (!ec) {
            for (const auto& ancestor : _stack) {
                if (ancestor.canonicalPath == frame.canonicalPath) {
                    FERRY_LOG_WARNING_CAT("DirectoryWalker", "Not following symlink cycle at " + directory.fullPath());
                    return false;
                }
            }
        }
        ec.clear();
    }

    std::vector<DirectoryEntry> children;
    if (!readDirectory(directory.fullPath(), children, ec)) {
        auto info = makeFileError(FileError::TraversalEntry, "Failed to read directory", directory.fullPath(), ec);
        reportEntryError(directory.fullPath(), std::move(info));
        return false;
    }

    for (auto& child : children) {
        if (child.isDirectory()) {
            if (_filter.acceptsDirectory(child.fullPath())) {
                frame.subdirectories.push_back(std::move(child));
            }
        } else if (shouldYield(child)) {
            _pending.push_back(std::move(child));
        }
    }
    _stack.push_back(std::move(frame));
    return true;
}

void DirectoryWalker::advance() {
    while (true) {
        if (_pendingPos < _pending.size()) {
            _current = std::move(_pending[_pendingPos++]);
            if (_pendingPos == _pending.size()) {
                _pending.clear();
                _pendingPos = 0;
            }
            return;
        }

        if (_stack.empty()) {
            _current.reset();
            return;
        }

        Frame& top = _stack.back();
        if (top.next >= top.subdirectories.size()) {
            _stack.pop_back();
            continue;
        }

        DirectoryEntry sub = std::move(top.subdirectories[top.next++]);
        if (shouldYield(sub)) {
            _pending.push_back(sub);
        }
        // top may dangle after this call
        enterDirectory(sub);
    }
}

} // namespace Ferry::Core::IO
