/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Steadfast Core project.
 */
#include "ErrorClassifier.h"
#include <cerrno>

namespace Steadfast::Core::IO {

const char* operationKindName(OperationKind kind) noexcept {
    switch (kind) {
        case OperationKind::Stat: return "stat";
        case OperationKind::Lstat: return "lstat";
        case OperationKind::ReadFile: return "readFile";
        case OperationKind::WriteFile: return "writeFile";
        case OperationKind::Copy: return "copy";
        case OperationKind::Move: return "move";
        case OperationKind::Rename: return "rename";
        case OperationKind::Remove: return "remove";
        case OperationKind::Unlink: return "unlink";
        case OperationKind::Rmdir: return "rmdir";
        case OperationKind::Mkdir: return "mkdir";
        case OperationKind::EnsureDir: return "ensureDir";
        case OperationKind::EnsureDirWritable: return "ensureDirWritable";
        case OperationKind::Link: return "link";
        case OperationKind::Symlink: return "symlink";
        case OperationKind::Chmod: return "chmod";
        case OperationKind::Utimes: return "utimes";
        case OperationKind::ReadDir: return "readDir";
        case OperationKind::ReadLink: return "readLink";
    }
    return "unknown";
}

const char* recoveryActionName(RecoveryDecision::Action action) noexcept {
    switch (action) {
        case RecoveryDecision::Action::Ignore: return "Ignore";
        case RecoveryDecision::Action::RetryAfterDelay: return "RetryAfterDelay";
        case RecoveryDecision::Action::RetryAfterUserChoice: return "RetryAfterUserChoice";
        case RecoveryDecision::Action::RetryAfterElevation: return "RetryAfterElevation";
        case RecoveryDecision::Action::Fail: return "Fail";
    }
    return "Fail";
}

bool isIdempotentDelete(OperationKind kind) noexcept {
    return kind == OperationKind::Remove || kind == OperationKind::Unlink || kind == OperationKind::Rmdir;
}

RecoveryDecision classify(const FileErrorInfo& error, OperationKind kind, const ClassifyContext& ctx) {
    const FileError code = error.code;

    if (code == FileError::FileNotFound && isIdempotentDelete(kind)) {
        return RecoveryDecision::ignore();
    }

    // Some network and cloud-synced drivers report EEXIST even when nothing conflicts
    if (code == FileError::AlreadyExists &&
        (kind == OperationKind::Mkdir || kind == OperationKind::EnsureDir)) {
        return RecoveryDecision::ignore();
    }

    if (kind == OperationKind::Rmdir) {
        const bool retryable = code == FileError::Busy || code == FileError::AccessDenied || code == FileError::Unknown;
        if (retryable && ctx.attempt < ctx.rmdirBudget.maxAttempts) {
            return RecoveryDecision::retryAfterDelay(ctx.rmdirBudget.delay);
        }
        return RecoveryDecision::fail();
    }

    if (kind == OperationKind::Rename && code == FileError::AccessDenied && ctx.destinationIsDirectory) {
        return RecoveryDecision::fail();
    }

    switch (code) {
        case FileError::Busy:
            return RecoveryDecision::retryAfterUserChoice(PromptKind::Busy);
        case FileError::AccessDenied:
            return RecoveryDecision::retryAfterUserChoice(PromptKind::AccessDenied);
        default:
            return RecoveryDecision::fail();
    }
}

FileError errnoToFileError(int err) noexcept {
    switch (err) {
        case 0:
            return FileError::None;
        case ENOENT:
            return FileError::FileNotFound;
        case EBUSY:
        case ETXTBSY:
            return FileError::Busy;
        case EACCES:
        case EPERM:
            return FileError::AccessDenied;
        case EEXIST:
            return FileError::AlreadyExists;
        case ENOTEMPTY:
        case ENOTDIR:
        case EISDIR:
        case EINVAL:
        case ENAMETOOLONG:
        case ELOOP:
        case EXDEV:
        case EROFS:
        case ENOSPC:
        case EDQUOT:
        case EIO:
        case EMLINK:
        case EBADF:
        case EFBIG:
            return FileError::IOError;
        default:
            return FileError::Unknown;
    }
}

FileErrorInfo makeOsError(int err, const std::string& path, const std::string& message) {
    return makeOsError(std::error_code(err, std::generic_category()), path, message);
}

FileErrorInfo makeOsError(const std::error_code& ec, const std::string& path, const std::string& message) {
    FileErrorInfo info;
    info.code = (ec.category() == std::generic_category() || ec.category() == std::system_category())
                    ? errnoToFileError(ec.value())
                    : FileError::Unknown;
    info.message = message.empty() ? ec.message() : message + ": " + ec.message();
    info.systemError = ec;
    info.path = path;
    return info;
}

} // namespace Steadfast::Core::IO
