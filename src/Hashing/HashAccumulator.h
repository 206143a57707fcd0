/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Ferry Core project.
 */

/**
 * @file HashAccumulator.h
 * @brief Streaming digest state shared by every HashEngine algorithm
 */
#pragma once
#include <cstddef>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>

#include "HashAlgorithm.h"

namespace Ferry::Core::Hashing {

/**
 * @brief Append-only digest accumulator
 *
 * Feed any number of chunks with update(), then call finalize() exactly once to get the
 * formatted digest. Chunk boundaries never affect the result. Touching the accumulator after
 * finalize() is a programming error and throws std::logic_error.
 *
 * @code
 * auto acc = createHashAccumulator(HashAlgorithm::Sha256);
 * acc->update(firstChunk);
 * acc->update(secondChunk);
 * std::string hex = acc->finalize();
 * @endcode
 */
class IHashAccumulator {
public:
    virtual ~IHashAccumulator() = default;

    void update(std::span<const std::byte> data) {
        if (_finalized) {
            throw std::logic_error("IHashAccumulator::update called after finalize");
        }
        if (!data.empty()) {
            doUpdate(data);
        }
    }

    std::string finalize() {
        if (_finalized) {
            throw std::logic_error("IHashAccumulator::finalize called twice");
        }
        _finalized = true;
        return doFinalize();
    }

    bool finalized() const noexcept { return _finalized; }
    virtual HashAlgorithm algorithm() const noexcept = 0;

protected:
    virtual void doUpdate(std::span<const std::byte> data) = 0;
    virtual std::string doFinalize() = 0;

private:
    bool _finalized = false;
};

/**
 * @brief Creates a fresh accumulator for @p algorithm
 * @throws FileOperationError(UnknownAlgorithm) if the algorithm's library is unavailable in
 *         this build or refused to initialize
 */
std::unique_ptr<IHashAccumulator> createHashAccumulator(HashAlgorithm algorithm);

} // namespace Ferry::Core::Hashing
