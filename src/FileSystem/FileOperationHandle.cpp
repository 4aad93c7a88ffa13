/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Steadfast Core project.
 */
#include "FileOperationHandle.h"
#include <chrono>

namespace Steadfast::Core::IO {

const char* fileErrorToString(FileError error) noexcept {
    switch (error) {
        case FileError::None: return "None";
        case FileError::FileNotFound: return "FileNotFound";
        case FileError::Busy: return "Busy";
        case FileError::AccessDenied: return "AccessDenied";
        case FileError::AlreadyExists: return "AlreadyExists";
        case FileError::SameFile: return "SameFile";
        case FileError::UserCanceled: return "UserCanceled";
        case FileError::ElevationRejected: return "ElevationRejected";
        case FileError::ElevationChannelError: return "ElevationChannelError";
        case FileError::IOError: return "IOError";
        case FileError::Unknown: return "Unknown";
    }
    return "Unknown";
}

void FileOperationHandle::wait() const {
    if (!_s) return;

    // Fast path - already complete
    if (_s->isComplete.load(std::memory_order_acquire)) {
        return;
    }

    // Slow path - wait for completion with cooperative progress pumping
    std::unique_lock<std::mutex> lock(_s->completionMutex);
    while (!_s->isComplete.load(std::memory_order_acquire)) {
        lock.unlock();
        if (_s->progress) {
            _s->progress();
        }
        lock.lock();
        _s->completionCV.wait_for(lock, std::chrono::milliseconds(1), [this]{
            return _s->isComplete.load(std::memory_order_acquire);
        });
    }
}

FileOpStatus FileOperationHandle::status() const noexcept {
    return _s ? _s->st.load(std::memory_order_acquire) : FileOpStatus::Pending;
}

std::span<const std::byte> FileOperationHandle::contentsBytes() const {
    if (!_s) return {};
    wait();
    return std::span<const std::byte>(_s->bytes.data(), _s->bytes.size());
}

std::string FileOperationHandle::contentsText() const {
    if (!_s) return {};
    wait();

    // readLink fills text; reads convert bytes on demand
    if (!_s->text.empty()) {
        return _s->text;
    }
    return std::string(reinterpret_cast<const char*>(_s->bytes.data()), _s->bytes.size());
}

uint64_t FileOperationHandle::bytesWritten() const {
    if (!_s) return 0ULL;
    wait();
    return _s->wrote;
}

const std::optional<FileMetadata>& FileOperationHandle::metadata() const {
    static const std::optional<FileMetadata> empty;
    if (!_s) return empty;
    wait();
    return _s->metadata;
}

const std::vector<std::string>& FileOperationHandle::directoryEntries() const {
    static const std::vector<std::string> empty;
    if (!_s) return empty;
    wait();
    return _s->directoryEntries;
}

uint32_t FileOperationHandle::attempts() const {
    if (!_s) return 0;
    wait();
    return _s->attempts.load(std::memory_order_acquire);
}

const FileErrorInfo& FileOperationHandle::errorInfo() const {
    static FileErrorInfo emptyError;
    if (!_s) return emptyError;
    wait();
    return _s->error;
}

FileOperationHandle FileOperationHandle::immediate(FileOpStatus status) {
    auto state = std::make_shared<OpState>();
    state->st.store(status, std::memory_order_release);
    state->isComplete.store(true, std::memory_order_release);
    return FileOperationHandle(state);
}

} // namespace Steadfast::Core::IO
