/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Ferry Core project.
 */

#include "PathUtil.h"

#include <algorithm>
#include <cctype>

#include "FileError.h"

namespace Ferry::Core::IO::PathUtil {

namespace {
    std::string toLower(std::string_view s) {
        std::string out(s);
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    // Length of the drive prefix ("C:") on Windows, 0 elsewhere
    size_t driveLength(std::string_view path) noexcept {
#if defined(_WIN32)
        if (path.size() >= 2 && path[1] == ':' && std::isalpha(static_cast<unsigned char>(path[0]))) {
            return 2;
        }
#else
        (void)path;
#endif
        return 0;
    }

    size_t lastSeparator(std::string_view path) noexcept {
        for (size_t i = path.size(); i > 0; --i) {
            if (isSeparator(path[i - 1])) return i - 1;
        }
        return std::string_view::npos;
    }

    bool isAbsolute(std::string_view path) noexcept {
        const size_t drive = driveLength(path);
        return path.size() > drive && isSeparator(path[drive]);
    }
}

bool isSeparator(char c) noexcept {
#if defined(_WIN32)
    return c == '/' || c == '\\';
#else
    return c == '/';
#endif
}

std::string parent(std::string_view path) {
    const size_t drive = driveLength(path);
    const size_t sep = lastSeparator(path);
    if (sep == std::string_view::npos) {
        return std::string(path.substr(0, drive));
    }

    std::string_view head = path.substr(0, sep + 1);
    // Strip trailing separators unless the head is nothing but a root
    size_t end = head.size();
    while (end > drive && isSeparator(head[end - 1])) {
        --end;
    }
    if (end == drive) {
        return std::string(head);
    }
    return std::string(head.substr(0, end));
}

std::string leafName(std::string_view path) {
    const size_t sep = lastSeparator(path);
    if (sep == std::string_view::npos) {
        return std::string(path.substr(driveLength(path)));
    }
    return std::string(path.substr(sep + 1));
}

std::pair<std::string, std::string> splitExtension(std::string_view path) {
    const size_t sep = lastSeparator(path);
    const size_t leafStart = (sep == std::string_view::npos) ? driveLength(path) : sep + 1;

    const size_t dot = path.rfind('.');
    if (dot == std::string_view::npos || dot < leafStart) {
        return {std::string(path), std::string()};
    }

    // A dot that is only preceded by other dots in the leaf does not start an extension
    size_t firstNonDot = leafStart;
    while (firstNonDot < path.size() && path[firstNonDot] == '.') {
        ++firstNonDot;
    }
    if (dot < firstNonDot) {
        return {std::string(path), std::string()};
    }
    return {std::string(path.substr(0, dot)), std::string(path.substr(dot))};
}

std::string extension(std::string_view path, bool removeDot) {
    auto ext = splitExtension(path).second;
    if (removeDot && !ext.empty() && ext.front() == '.') {
        ext.erase(0, 1);
    }
    return toLower(ext);
}

std::string withExtension(std::string_view path, std::string_view extWithDot) {
    auto [root, ext] = splitExtension(path);
    if (ext.empty()) {
        throwFileError(FileError::InvalidPath, "Path has no extension to replace", std::string(path));
    }
    return root + std::string(extWithDot);
}

std::string join(std::string_view base, std::string_view child) {
    if (base.empty() || isAbsolute(child)) {
        return std::string(child);
    }
    std::string out(base);
    if (!isSeparator(out.back()) && !(out.size() == driveLength(out))) {
        out.push_back(kPreferredSeparator);
    }
    out.append(child);
    return out;
}

std::string normalizeExtension(std::string_view ext) {
    if (!ext.empty() && ext.front() == '.') {
        ext.remove_prefix(1);
    }
    return toLower(ext);
}

} // namespace Ferry::Core::IO::PathUtil
