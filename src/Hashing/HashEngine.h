/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Ferry Core project.
 */

/**
 * @file HashEngine.h
 * @brief Streaming content digests over files, streams and memory
 *
 * HashEngine reads its input in bufferSize chunks and feeds each chunk to an
 * IHashAccumulator, so memory use is bounded by the buffer regardless of input size. The
 * digest never depends on the chosen buffer size.
 *
 * Algorithm identifiers are validated before any I/O happens: an unknown name fails with
 * FileError::UnknownAlgorithm without opening the file.
 *
 * @code
 * using namespace Ferry::Core::Hashing;
 * std::string hex = HashEngine::computeHash("/data/big.iso", "sha256");
 * std::string crc = HashEngine::computeHash("/data/big.iso", HashAlgorithm::Crc32, 1024 * 1024);
 * @endcode
 */
#pragma once
#include <cstddef>
#include <span>
#include <string>
#include <string_view>

#include "HashAlgorithm.h"

namespace Ferry::Core::IO {
class FileStream;
}

namespace Ferry::Core::Hashing {

class HashEngine {
public:
    static constexpr size_t kDefaultBufferSize = 256 * 1024;

    /**
     * @brief Digest of everything remaining in @p source
     * @throws std::invalid_argument if bufferSize is 0
     * @throws IO::FileOperationError (UnknownAlgorithm, IOError)
     */
    static std::string computeHash(IO::FileStream& source, HashAlgorithm algorithm,
                                   size_t bufferSize = kDefaultBufferSize);
    static std::string computeHash(IO::FileStream& source, std::string_view algorithm,
                                   size_t bufferSize = kDefaultBufferSize);

    /**
     * @brief Digest of a local file
     * @throws IO::FileOperationError (UnknownAlgorithm, SourceMissing, AccessDenied, IOError)
     */
    static std::string computeHash(const std::string& path, HashAlgorithm algorithm,
                                   size_t bufferSize = kDefaultBufferSize);
    static std::string computeHash(const std::string& path, std::string_view algorithm,
                                   size_t bufferSize = kDefaultBufferSize);

    // Digest of an in-memory buffer, still fed to the accumulator bufferSize bytes at a time
    static std::string computeHashBytes(std::span<const std::byte> data, HashAlgorithm algorithm,
                                        size_t bufferSize = kDefaultBufferSize);
    static std::string computeHashBytes(std::span<const std::byte> data, std::string_view algorithm,
                                        size_t bufferSize = kDefaultBufferSize);
};

} // namespace Ferry::Core::Hashing
