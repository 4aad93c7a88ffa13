/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Steadfast Core project.
 */

/**
 * @file ErrorClassifier.h
 * @brief Maps a normalized OS error and operation kind to a recovery action
 *
 * classify() is pure: anything that needs I/O (the rename destination check, the
 * attempt counter) is gathered by the caller and passed in through ClassifyContext.
 *
 * Rules, in order:
 * - FileNotFound during remove/unlink/rmdir -> Ignore
 * - AlreadyExists during mkdir/ensureDir -> Ignore
 * - rmdir with Busy/AccessDenied/Unknown -> RetryAfterDelay until the budget is spent, then Fail
 * - rename with AccessDenied onto an existing directory -> Fail
 * - Busy -> RetryAfterUserChoice (busy prompt)
 * - AccessDenied -> RetryAfterUserChoice (access-denied prompt)
 * - anything else -> Fail
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include "FileOperationHandle.h"

namespace Steadfast::Core::IO {

enum class OperationKind {
    Stat,
    Lstat,
    ReadFile,
    WriteFile,
    Copy,
    Move,
    Rename,
    Remove,
    Unlink,
    Rmdir,
    Mkdir,
    EnsureDir,
    EnsureDirWritable,
    Link,
    Symlink,
    Chmod,
    Utimes,
    ReadDir,
    ReadLink
};

const char* operationKindName(OperationKind kind) noexcept;

// Delete-like operations treat a missing target as success
bool isIdempotentDelete(OperationKind kind) noexcept;

/**
 * @brief Fixed retry budget for automatic (unprompted) retries
 */
struct RetryBudget {
    uint32_t maxAttempts = 3;                          ///< total primitive invocations
    std::chrono::milliseconds delay{100};              ///< spacing between invocations
};

enum class PromptKind { None, Busy, AccessDenied };

struct RecoveryDecision {
    enum class Action { Ignore, RetryAfterDelay, RetryAfterUserChoice, RetryAfterElevation, Fail };

    Action action = Action::Fail;
    std::chrono::milliseconds delay{0};
    PromptKind prompt = PromptKind::None;

    static RecoveryDecision ignore() { return {Action::Ignore, {}, PromptKind::None}; }
    static RecoveryDecision fail() { return {Action::Fail, {}, PromptKind::None}; }
    static RecoveryDecision retryAfterDelay(std::chrono::milliseconds d) { return {Action::RetryAfterDelay, d, PromptKind::None}; }
    static RecoveryDecision retryAfterUserChoice(PromptKind p) { return {Action::RetryAfterUserChoice, {}, p}; }
    static RecoveryDecision retryAfterElevation() { return {Action::RetryAfterElevation, {}, PromptKind::None}; }

    bool operator==(const RecoveryDecision&) const = default;
};

const char* recoveryActionName(RecoveryDecision::Action action) noexcept;

struct ClassifyContext {
    uint32_t attempt = 1;                    ///< attempts made so far, including the failed one
    RetryBudget rmdirBudget{};
    bool destinationIsDirectory = false;     ///< rename only: destination exists and is a directory
};

RecoveryDecision classify(const FileErrorInfo& error, OperationKind kind, const ClassifyContext& ctx = {});

// errno -> FileError normalization
FileError errnoToFileError(int err) noexcept;

// Builds the error a primitive reports for errno `err` on `path`
FileErrorInfo makeOsError(int err, const std::string& path, const std::string& message = {});
FileErrorInfo makeOsError(const std::error_code& ec, const std::string& path, const std::string& message = {});

} // namespace Steadfast::Core::IO
