/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Ferry Core project.
 */

#pragma once
#include "ITransferBackend.h"

namespace Ferry::Core::IO {

/**
 * @brief Win32 transfer primitives
 *
 * Copies go through CopyFileW (fail-if-exists when not overwriting), moves through
 * MoveFileExW with MOVEFILE_REPLACE_EXISTING and, when permitted, MOVEFILE_COPY_ALLOWED.
 * ERROR_NOT_SAME_DEVICE surfaces as FileError::CrossVolume.
 */
class WindowsTransferBackend : public ITransferBackend {
public:
    const char* name() const noexcept override { return "win32"; }

    uint64_t copyFile(const std::string& source, const std::string& destination,
                      const BackendCopyOptions& options) override;

    BackendMoveResult moveFile(const std::string& source, const std::string& destination,
                               bool allowCrossVolumeCopy, const BackendCopyOptions& options) override;

    void renameDirectory(const std::string& source, const std::string& destination, bool overwrite) override;
};

} // namespace Ferry::Core::IO
