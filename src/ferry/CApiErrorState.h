/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Ferry Core project.
 */

#pragma once
#include <string>

#include "ferry/ferry_file_ops.h"

namespace Ferry::Core::CApi {

// Per-thread record of the last failure reported across the C boundary
void setLastError(FerryFileError code, std::string message);
void clearLastError() noexcept;

// Copies s into memory owned by the caller (release with ferry_string_dispose)
FerryStatus copyStringOut(const std::string& s, FerryOwnedString* out);

} // namespace Ferry::Core::CApi
