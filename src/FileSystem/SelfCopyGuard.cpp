/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Steadfast Core project.
 */
#include "SelfCopyGuard.h"
#include <format>

namespace Steadfast::Core::IO {

FileErrorInfo checkNotSelfCopy(IFilePrimitives& primitives, const std::string& src, const std::string& dst) {
    FileMetadata srcMeta;
    auto srcErr = primitives.stat(src, srcMeta);
    if (!srcErr.ok()) {
        return srcErr;
    }

    FileMetadata dstMeta;
    auto dstErr = primitives.stat(dst, dstMeta);
    if (dstErr.code == FileError::FileNotFound) {
        return {};
    }
    if (!dstErr.ok()) {
        return dstErr;
    }

    if (srcMeta.device == dstMeta.device && srcMeta.inode == dstMeta.inode) {
        FileErrorInfo err;
        err.code = FileError::SameFile;
        err.message = std::format("Source \"{}\" and destination \"{}\" are the same file (device {}, inode {})",
                                  src, dst, srcMeta.device, srcMeta.inode);
        err.path = dst;
        return err;
    }
    return {};
}

} // namespace Steadfast::Core::IO
