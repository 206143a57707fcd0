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
 * @brief POSIX transfer primitives
 *
 * Copies stream the source into a private mkstemp() sibling and publish it with link()
 * (exclusive, for overwrite=false) or rename() (atomic replace). Filesystems that refuse hard
 * links fall back to O_CREAT|O_EXCL at the destination, which is unlinked again if streaming
 * fails. Moves use rename() when overwriting and link()+unlink() otherwise; directories use
 * renameat2(RENAME_NOREPLACE) where the kernel provides it.
 */
class PosixTransferBackend : public ITransferBackend {
public:
    const char* name() const noexcept override { return "posix"; }

    uint64_t copyFile(const std::string& source, const std::string& destination,
                      const BackendCopyOptions& options) override;

    BackendMoveResult moveFile(const std::string& source, const std::string& destination,
                               bool allowCrossVolumeCopy, const BackendCopyOptions& options) override;

    void renameDirectory(const std::string& source, const std::string& destination, bool overwrite) override;
};

} // namespace Ferry::Core::IO
