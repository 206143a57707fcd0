/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Ferry Core project.
 */

/**
 * @file PathUtil.h
 * @brief Stateless helpers over path strings
 *
 * These operate on the textual path only and never touch the filesystem. Separators are
 * '/' everywhere and additionally '\\' on Windows. A trailing separator is significant:
 * "a/b/" has parent "a/b" and an empty leaf name.
 */
#pragma once
#include <string>
#include <string_view>
#include <utility>

namespace Ferry::Core::IO::PathUtil {

#if defined(_WIN32)
inline constexpr char kPreferredSeparator = '\\';
#else
inline constexpr char kPreferredSeparator = '/';
#endif

bool isSeparator(char c) noexcept;

/**
 * @brief Directory part of a path ("/a/b/c.txt" -> "/a/b", "c.txt" -> "")
 *
 * Trailing separators are stripped from the result unless it is a root ("/" stays "/").
 */
std::string parent(std::string_view path);

/**
 * @brief Final component of a path ("/a/b/c.txt" -> "c.txt")
 */
std::string leafName(std::string_view path);

/**
 * @brief Splits into (root, ext) where ext includes the dot ("a/b.tar.gz" -> ("a/b.tar", ".gz"))
 *
 * Leading dots of the leaf name do not start an extension: ".bashrc" has no extension.
 */
std::pair<std::string, std::string> splitExtension(std::string_view path);

/**
 * @brief Lowercased extension of the leaf name
 * @param removeDot If true returns "jpg", otherwise ".jpg"
 */
std::string extension(std::string_view path, bool removeDot = true);

/**
 * @brief Replaces the extension ("/a/b/c.ext1", ".ext2" -> "/a/b/c.ext2")
 * @throws FileOperationError(InvalidPath) if the path has no extension to replace
 */
std::string withExtension(std::string_view path, std::string_view extWithDot);

/**
 * @brief Joins two components with the preferred separator
 *
 * If @p child is absolute it is returned unchanged.
 */
std::string join(std::string_view base, std::string_view child);

/**
 * @brief Normalizes an extension for allowlist comparisons (".PNG" -> "png")
 */
std::string normalizeExtension(std::string_view ext);

} // namespace Ferry::Core::IO::PathUtil
