/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Ferry Core project.
 */

#include "HashAlgorithm.h"

#include <cctype>
#include <string>

#include "FileSystem/FileError.h"

namespace Ferry::Core::Hashing {

namespace {
    struct AlgorithmAlias {
        std::string_view compact;
        HashAlgorithm algorithm;
    };

    // Keys are lowercase with '-' and '_' removed
    constexpr AlgorithmAlias kAliases[] = {
        {"crc32", HashAlgorithm::Crc32},
        {"crc64", HashAlgorithm::Crc64},
        {"md5", HashAlgorithm::Md5},
        {"sha1", HashAlgorithm::Sha1},
        {"sha224", HashAlgorithm::Sha224},
        {"sha256", HashAlgorithm::Sha256},
        {"sha384", HashAlgorithm::Sha384},
        {"sha512", HashAlgorithm::Sha512},
        {"sha3224", HashAlgorithm::Sha3_224},
        {"sha3256", HashAlgorithm::Sha3_256},
        {"sha3384", HashAlgorithm::Sha3_384},
        {"sha3512", HashAlgorithm::Sha3_512},
        {"shake128", HashAlgorithm::Shake128},
        {"shake256", HashAlgorithm::Shake256},
        {"blake2b", HashAlgorithm::Blake2b},
        {"blake2b512", HashAlgorithm::Blake2b},
        {"blake2s", HashAlgorithm::Blake2s},
        {"blake2s256", HashAlgorithm::Blake2s},
        {"xxhash32", HashAlgorithm::XxHash32},
        {"xxh32", HashAlgorithm::XxHash32},
        {"xxhash64", HashAlgorithm::XxHash64},
        {"xxh64", HashAlgorithm::XxHash64},
    };
}

std::string_view hashAlgorithmName(HashAlgorithm algorithm) noexcept {
    switch (algorithm) {
        case HashAlgorithm::Crc32: return "crc32";
        case HashAlgorithm::Crc64: return "crc64";
        case HashAlgorithm::Md5: return "md5";
        case HashAlgorithm::Sha1: return "sha1";
        case HashAlgorithm::Sha224: return "sha224";
        case HashAlgorithm::Sha256: return "sha256";
        case HashAlgorithm::Sha384: return "sha384";
        case HashAlgorithm::Sha512: return "sha512";
        case HashAlgorithm::Sha3_224: return "sha3-224";
        case HashAlgorithm::Sha3_256: return "sha3-256";
        case HashAlgorithm::Sha3_384: return "sha3-384";
        case HashAlgorithm::Sha3_512: return "sha3-512";
        case HashAlgorithm::Shake128: return "shake128";
        case HashAlgorithm::Shake256: return "shake256";
        case HashAlgorithm::Blake2b: return "blake2b";
        case HashAlgorithm::Blake2s: return "blake2s";
        case HashAlgorithm::XxHash32: return "xxhash32";
        case HashAlgorithm::XxHash64: return "xxhash64";
    }
    return "unknown";
}

std::optional<HashAlgorithm> parseHashAlgorithm(std::string_view name) noexcept {
    std::string compact;
    compact.reserve(name.size());
    for (char c : name) {
        if (c == '-' || c == '_') continue;
        compact.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    for (const auto& alias : kAliases) {
        if (alias.compact == compact) return alias.algorithm;
    }
    return std::nullopt;
}

HashAlgorithm requireHashAlgorithm(std::string_view name) {
    if (auto alg = parseHashAlgorithm(name)) {
        return *alg;
    }
    auto info = IO::makeFileError(IO::FileError::UnknownAlgorithm,
                                  "Unknown hash algorithm '" + std::string(name) + "'");
    info.operation = "computeHash";
    throw IO::FileOperationError(std::move(info));
}

bool isHashAlgorithmAvailable(HashAlgorithm algorithm) noexcept {
    switch (algorithm) {
        case HashAlgorithm::XxHash32:
        case HashAlgorithm::XxHash64:
#if defined(FERRY_WITH_XXHASH)
            return true;
#else
            return false;
#endif
        default:
            return true;
    }
}

} // namespace Ferry::Core::Hashing
