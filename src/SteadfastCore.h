/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Steadfast Core project.
 */

#pragma once

/**
 * @file SteadfastCore.h
 * @brief Single header that includes all SteadfastCore components
 */

// Core common utilities
#include "CoreCommon.h"

// Logging
#include "Logging/ConsoleSink.h"
#include "Logging/ILogSink.h"
#include "Logging/LogEntry.h"
#include "Logging/LogLevel.h"
#include "Logging/Logger.h"

// Concurrency
#include "Concurrency/IConcurrencyProvider.h"
#include "Concurrency/WorkContractGroup.h"
#include "Concurrency/WorkContractHandle.h"
#include "Concurrency/WorkService.h"

// File system
#include "FileSystem/ElevatedActions.h"
#include "FileSystem/ElevationChannel.h"
#include "FileSystem/ElevationMessages.h"
#include "FileSystem/ElevationProtocol.h"
#include "FileSystem/ErrorClassifier.h"
#include "FileSystem/ErrorContext.h"
#include "FileSystem/FileOperationHandle.h"
#include "FileSystem/IFilePrimitives.h"
#include "FileSystem/LocalFilePrimitives.h"
#include "FileSystem/RecoveryPrompts.h"
#include "FileSystem/ResilientFileSystem.h"
#include "FileSystem/SelfCopyGuard.h"
