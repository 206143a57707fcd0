/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Ferry Core project.
 */

#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace Ferry::Core::IO {

/**
 * @brief What move() does when source and destination are on different volumes
 *
 * - Allow: fall back to copy-then-delete-source
 * - NotifyThenAllow: call TransferRequest::onCrossVolume, log a warning, then retry once
 *   with copying allowed
 * - Fail: raise FileError::CrossVolume and leave both paths untouched
 */
enum class CrossVolumePolicy { Allow, NotifyThenAllow, Fail };

using CrossVolumeCallback = std::function<void(const std::string& source, const std::string& destination)>;

/**
 * @brief Parameters for a single copy or move
 * @param source Existing file (or directory when allowDirectories is set)
 * @param destination Final path of the transferred entry
 * @param overwrite Replace an existing destination; when false an existing destination is never touched
 * @param allowDirectories Accept a directory source (copied recursively)
 * @param createParentDirs Create the destination's parent chain if missing
 * @param preserveModTime After copying over an existing file, restore that file's previous modification time
 * @param crossVolumePolicy Overrides the engine's configured default for move()
 * @param onCrossVolume Notified before the retry under CrossVolumePolicy::NotifyThenAllow
 */
struct TransferRequest {
    std::string source;
    std::string destination;
    bool overwrite = false;
    bool allowDirectories = false;
    bool createParentDirs = false;
    bool preserveModTime = false;
    std::optional<CrossVolumePolicy> crossVolumePolicy;
    CrossVolumeCallback onCrossVolume;
};

struct TransferOutcome {
    uint64_t bytesTransferred = 0;
    bool noOp = false;                     // source and destination were the same path
    bool usedCrossVolumeFallback = false;  // move completed by copying then deleting the source
};

} // namespace Ferry::Core::IO
