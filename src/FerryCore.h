/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Ferry Core project.
 */

#pragma once

/**
 * @file FerryCore.h
 * @brief Single header that includes all FerryCore components
 */

// Core common utilities
#include "CoreCommon.h"

// Logging
#include "Logging/ConsoleSink.h"
#include "Logging/ILogSink.h"
#include "Logging/LogEntry.h"
#include "Logging/LogLevel.h"
#include "Logging/Logger.h"

// File system
#include "FileSystem/AtomicTransferEngine.h"
#include "FileSystem/DirectoryEntry.h"
#include "FileSystem/DirectoryWalker.h"
#include "FileSystem/FileError.h"
#include "FileSystem/FileStream.h"
#include "FileSystem/FileUtilities.h"
#include "FileSystem/ITransferBackend.h"
#include "FileSystem/PathUtil.h"
#include "FileSystem/TransferRequest.h"

// Hashing
#include "Hashing/HashAccumulator.h"
#include "Hashing/HashAlgorithm.h"
#include "Hashing/HashEngine.h"
