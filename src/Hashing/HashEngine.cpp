/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Ferry Core project.
 */

#include "HashEngine.h"

#include <algorithm>
#include <stdexcept>
#include <vector>

#include "HashAccumulator.h"
#include "FileSystem/FileError.h"
#include "FileSystem/FileStream.h"
#include "Logging/Logger.h"

namespace Ferry::Core::Hashing {

namespace {
    void requireBufferSize(size_t bufferSize) {
        if (bufferSize == 0) {
            throw std::invalid_argument("HashEngine: bufferSize must be greater than zero");
        }
    }

    std::string drain(IO::FileStream& source, IHashAccumulator& acc, size_t bufferSize) {
        std::vector<std::byte> buffer(bufferSize);
        while (true) {
            auto result = source.read(buffer);
            if (!result.success()) {
                auto info = IO::makeFileError(*result.error, "Read failed while hashing", source.path());
                info.operation = "computeHash";
                throw IO::FileOperationError(std::move(info));
            }
            if (result.bytesTransferred == 0) break;
            acc.update(std::span<const std::byte>(buffer.data(), result.bytesTransferred));
        }
        return acc.finalize();
    }
}

std::string HashEngine::computeHash(IO::FileStream& source, HashAlgorithm algorithm, size_t bufferSize) {
    requireBufferSize(bufferSize);
    auto acc = createHashAccumulator(algorithm);
    return drain(source, *acc, bufferSize);
}

std::string HashEngine::computeHash(IO::FileStream& source, std::string_view algorithm, size_t bufferSize) {
    return computeHash(source, requireHashAlgorithm(algorithm), bufferSize);
}

std::string HashEngine::computeHash(const std::string& path, HashAlgorithm algorithm, size_t bufferSize) {
    requireBufferSize(bufferSize);
    // Fail on an unusable algorithm before the file is opened
    auto acc = createHashAccumulator(algorithm);
    auto stream = IO::openReadStream(path);

    FERRY_LOG_DEBUG_CAT("HashEngine", std::string(hashAlgorithmName(algorithm)) + " of " + path);
    return drain(*stream, *acc, bufferSize);
}

std::string HashEngine::computeHash(const std::string& path, std::string_view algorithm, size_t bufferSize) {
    return computeHash(path, requireHashAlgorithm(algorithm), bufferSize);
}

std::string HashEngine::computeHashBytes(std::span<const std::byte> data, HashAlgorithm algorithm, size_t bufferSize) {
    requireBufferSize(bufferSize);
    auto acc = createHashAccumulator(algorithm);
    for (size_t offset = 0; offset < data.size(); offset += bufferSize) {
        acc->update(data.subspan(offset, std::min(bufferSize, data.size() - offset)));
    }
    return acc->finalize();
}

std::string HashEngine::computeHashBytes(std::span<const std::byte> data, std::string_view algorithm, size_t bufferSize) {
    return computeHashBytes(data, requireHashAlgorithm(algorithm), bufferSize);
}

} // namespace Ferry::Core::Hashing
