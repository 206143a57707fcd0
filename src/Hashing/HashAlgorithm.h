/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Ferry Core project.
 */

#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace Ferry::Core::Hashing {

/**
 * @brief Closed set of digest algorithms understood by HashEngine
 *
 * Output formats:
 * - Crc32: 8 lowercase hex digits
 * - Crc64: 16 uppercase hex digits (ISO 3309 polynomial, reflected, zero init, no final xor)
 * - Shake128 / Shake256: 32 / 64 byte output, lowercase hex
 * - XxHash32 / XxHash64: canonical big-endian form, seed 0, lowercase hex
 * - everything else: the native digest in lowercase hex
 */
enum class HashAlgorithm : uint8_t {
    Crc32,
    Crc64,
    Md5,
    Sha1,
    Sha224,
    Sha256,
    Sha384,
    Sha512,
    Sha3_224,
    Sha3_256,
    Sha3_384,
    Sha3_512,
    Shake128,
    Shake256,
    Blake2b,
    Blake2s,
    XxHash32,
    XxHash64
};

inline constexpr std::array<HashAlgorithm, 18> kAllHashAlgorithms = {
    HashAlgorithm::Crc32,    HashAlgorithm::Crc64,    HashAlgorithm::Md5,      HashAlgorithm::Sha1,
    HashAlgorithm::Sha224,   HashAlgorithm::Sha256,   HashAlgorithm::Sha384,   HashAlgorithm::Sha512,
    HashAlgorithm::Sha3_224, HashAlgorithm::Sha3_256, HashAlgorithm::Sha3_384, HashAlgorithm::Sha3_512,
    HashAlgorithm::Shake128, HashAlgorithm::Shake256, HashAlgorithm::Blake2b,  HashAlgorithm::Blake2s,
    HashAlgorithm::XxHash32, HashAlgorithm::XxHash64
};

// Canonical identifier ("sha3-256", "xxhash64", ...)
std::string_view hashAlgorithmName(HashAlgorithm algorithm) noexcept;

/**
 * @brief Parses an algorithm identifier
 *
 * Matching ignores case and treats '-' and '_' as optional, so "SHA3-256", "sha3_256" and
 * "sha3256" all name the same algorithm.
 */
std::optional<HashAlgorithm> parseHashAlgorithm(std::string_view name) noexcept;

/**
 * @brief Like parseHashAlgorithm but throws FileOperationError(UnknownAlgorithm)
 */
HashAlgorithm requireHashAlgorithm(std::string_view name);

// False for algorithms whose backing library was not found at build time
bool isHashAlgorithmAvailable(HashAlgorithm algorithm) noexcept;

} // namespace Ferry::Core::Hashing
