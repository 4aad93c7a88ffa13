/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Steadfast Core project.
 */
#pragma once
#include "IFilePrimitives.h"

namespace Steadfast::Core::IO {

class LocalFilePrimitives : public IFilePrimitives {
public:
    LocalFilePrimitives() = default;
    ~LocalFilePrimitives() override = default;

    FileErrorInfo stat(const std::string& path, FileMetadata& out) override;
    FileErrorInfo lstat(const std::string& path, FileMetadata& out) override;

    FileErrorInfo readFile(const std::string& path, std::vector<std::byte>& out) override;
    FileErrorInfo writeFile(const std::string& path, std::span<const std::byte> data,
                            const WriteOptions& options, uint64_t& written) override;

    FileErrorInfo copyFile(const std::string& src, const std::string& dst, const CopyOptions& options) override;
    FileErrorInfo move(const std::string& src, const std::string& dst, bool overwriteExisting) override;
    FileErrorInfo rename(const std::string& src, const std::string& dst) override;

    FileErrorInfo removeAll(const std::string& path) override;
    FileErrorInfo unlink(const std::string& path) override;
    FileErrorInfo rmdir(const std::string& path) override;

    FileErrorInfo mkdir(const std::string& path, uint32_t mode) override;
    FileErrorInfo createDirectories(const std::string& path) override;
    FileErrorInfo readDirectory(const std::string& path, std::vector<std::string>& names) override;

    FileErrorInfo link(const std::string& existing, const std::string& newPath) override;
    FileErrorInfo symlink(const std::string& target, const std::string& linkPath) override;
    FileErrorInfo readLink(const std::string& path, std::string& target) override;

    FileErrorInfo chmod(const std::string& path, uint32_t mode) override;
    FileErrorInfo utimes(const std::string& path,
                         std::chrono::system_clock::time_point accessed,
                         std::chrono::system_clock::time_point modified) override;

    std::string getBackendType() const override { return "LocalFileSystem"; }
};

} // namespace Steadfast::Core::IO
