/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Steadfast Core project.
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <system_error>
#include <vector>

namespace Steadfast::Core::IO {

enum class FileOpStatus { Pending, Running, Complete, Failed, Canceled };

/**
 * Public error taxonomy surfaced by file operations.
 * Mapping guidelines:
 * - FileNotFound: ENOENT. Tolerated (never surfaced) by remove/unlink/rmdir
 * - Busy: EBUSY/ETXTBSY, target is held open or locked by another process
 * - AccessDenied: EACCES/EPERM
 * - AlreadyExists: EEXIST. Tolerated by mkdir/ensureDir
 * - SameFile: copy source and destination resolve to the same device and inode
 * - UserCanceled: the user chose Cancel in a recovery prompt
 * - ElevationRejected: the OS refused the elevation request (authorization dismissed)
 * - ElevationChannelError: the elevated helper could not be reached or reported nothing usable
 * - IOError: any other recognised OS failure
 * - Unknown: an errno with no mapping
 */
enum class FileError {
    None = 0,
    FileNotFound,
    Busy,
    AccessDenied,
    AlreadyExists,
    SameFile,
    UserCanceled,
    ElevationRejected,
    ElevationChannelError,
    IOError,
    Unknown
};

const char* fileErrorToString(FileError error) noexcept;

struct FileErrorInfo {
    FileError code = FileError::None;
    std::string message;
    std::optional<std::error_code> systemError;
    std::string path;
    std::string trace;          // "<operation> failed: <message>" followed by the call site

    bool ok() const noexcept { return code == FileError::None; }
};

struct FileMetadata {
    std::string path;
    bool exists = false;
    bool isDirectory = false;
    bool isRegularFile = false;
    bool isSymlink = false;
    uintmax_t size = 0;
    uint32_t mode = 0;          // permission bits
    uint64_t device = 0;
    uint64_t inode = 0;
    uint64_t linkCount = 0;
    uint32_t ownerId = 0;
    std::optional<std::chrono::system_clock::time_point> lastModified;
};

class FileOperationHandle {
public:
    FileOperationHandle() = default;

    void wait() const;
    FileOpStatus status() const noexcept;

    // Read results (views) - only valid after wait()
    std::span<const std::byte> contentsBytes() const;
    std::string contentsText() const;

    // Write results - only valid after wait()
    uint64_t bytesWritten() const;

    // stat/lstat results - only valid after wait()
    const std::optional<FileMetadata>& metadata() const;

    // readDir results (entry names, sorted) - only valid after wait()
    const std::vector<std::string>& directoryEntries() const;

    // Number of times the underlying primitive ran
    uint32_t attempts() const;

    // Error information - only valid after wait() and status is Failed or Canceled
    const FileErrorInfo& errorInfo() const;

    bool succeeded() const { return status() == FileOpStatus::Complete; }

    // Factory for immediate completion (no async work needed)
    static FileOperationHandle immediate(FileOpStatus status);

private:
    struct OpState {
        std::atomic<FileOpStatus> st{FileOpStatus::Pending};
        mutable std::mutex completionMutex;
        mutable std::condition_variable completionCV;
        std::atomic<bool> isComplete{false};

        // Optional progress hook called by wait() to ensure forward progress
        std::function<void()> progress;

        // Result data - only valid after completion
        std::vector<std::byte> bytes;                  // readFile
        uint64_t wrote = 0;                            // writeFile
        std::string text;                              // readLink
        std::optional<FileMetadata> metadata;          // stat/lstat
        std::vector<std::string> directoryEntries;     // readDir
        std::atomic<uint32_t> attempts{0};
        FileErrorInfo error;

        void complete(FileOpStatus final) noexcept {
            {
                std::lock_guard<std::mutex> lock(completionMutex);
                st.store(final, std::memory_order_release);
                isComplete.store(true, std::memory_order_release);
            }
            completionCV.notify_all();
        }

        void setError(FileErrorInfo info) {
            error = std::move(info);
        }

        void setError(FileError code, const std::string& msg,
                      const std::string& path = "",
                      std::optional<std::error_code> ec = std::nullopt) {
            error.code = code;
            error.message = msg;
            error.path = path;
            error.systemError = ec;
        }
    };

    std::shared_ptr<OpState> _s;
    explicit FileOperationHandle(std::shared_ptr<OpState> s) : _s(std::move(s)) {}

    friend class ResilientFileSystem;
};

} // namespace Steadfast::Core::IO
