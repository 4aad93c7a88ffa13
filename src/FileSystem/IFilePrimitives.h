/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Steadfast Core project.
 */

/**
 * @file IFilePrimitives.h
 * @brief Non-retrying filesystem primitives
 *
 * Implementations perform exactly one OS operation per call and report the outcome as a
 * FileErrorInfo (code None on success) carrying the errno and the path that failed.
 * ResilientFileSystem layers retry, prompting and elevation on top; nothing else in the
 * application should call a primitive directly.
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <span>
#include <string>
#include <vector>
#include "FileOperationHandle.h"

namespace Steadfast::Core::IO {

/**
 * @brief Options controlling file writes
 * @param append Append to end of file instead of truncating
 * @param fsync Force data to disk before reporting success
 * @param mode Permission bits used when the file is created
 */
struct WriteOptions {
    bool append = false;
    bool fsync = false;
    uint32_t mode = 0644;
};

/**
 * @brief Options controlling file copies
 * @param overwriteExisting Replace destination if it exists
 * @param preserveAttributes Preserve permission bits and modification time
 * @param skipSelfCopyCheck Caller guarantees source and destination are distinct files
 */
struct CopyOptions {
    bool overwriteExisting = true;
    bool preserveAttributes = true;
    bool skipSelfCopyCheck = false;
};

class IFilePrimitives {
public:
    virtual ~IFilePrimitives() = default;

    // Metadata
    virtual FileErrorInfo stat(const std::string& path, FileMetadata& out) = 0;
    virtual FileErrorInfo lstat(const std::string& path, FileMetadata& out) = 0;

    // Contents
    virtual FileErrorInfo readFile(const std::string& path, std::vector<std::byte>& out) = 0;
    virtual FileErrorInfo writeFile(const std::string& path, std::span<const std::byte> data,
                                    const WriteOptions& options, uint64_t& written) = 0;

    // Copy/Move
    virtual FileErrorInfo copyFile(const std::string& src, const std::string& dst, const CopyOptions& options) = 0;
    /**
     * @brief Moves src to dst, falling back to copy + remove across devices
     */
    virtual FileErrorInfo move(const std::string& src, const std::string& dst, bool overwriteExisting) = 0;
    virtual FileErrorInfo rename(const std::string& src, const std::string& dst) = 0;

    // Removal
    /**
     * @brief Removes a file or a directory tree
     * @note Reports FileNotFound when nothing exists at path
     */
    virtual FileErrorInfo removeAll(const std::string& path) = 0;
    virtual FileErrorInfo unlink(const std::string& path) = 0;
    virtual FileErrorInfo rmdir(const std::string& path) = 0;

    // Directories
    virtual FileErrorInfo mkdir(const std::string& path, uint32_t mode) = 0;
    virtual FileErrorInfo createDirectories(const std::string& path) = 0;
    virtual FileErrorInfo readDirectory(const std::string& path, std::vector<std::string>& names) = 0;

    // Links
    virtual FileErrorInfo link(const std::string& existing, const std::string& newPath) = 0;
    virtual FileErrorInfo symlink(const std::string& target, const std::string& linkPath) = 0;
    virtual FileErrorInfo readLink(const std::string& path, std::string& target) = 0;

    // Attributes
    virtual FileErrorInfo chmod(const std::string& path, uint32_t mode) = 0;
    virtual FileErrorInfo utimes(const std::string& path,
                                 std::chrono::system_clock::time_point accessed,
                                 std::chrono::system_clock::time_point modified) = 0;

    virtual std::string getBackendType() const = 0;
};

} // namespace Steadfast::Core::IO
