/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Steadfast Core project.
 */
#pragma once
#include <string>
#include "IFilePrimitives.h"

namespace Steadfast::Core::IO {

/**
 * @brief Pre-flight check that keeps copy() from copying a file onto itself
 *
 * Path comparison is not enough (hard links, symlinks, case-insensitive mounts), so the
 * check compares the device and inode of both sides. A missing destination passes.
 *
 * @return FileError::None when the copy may proceed, FileError::SameFile when both paths
 *         resolve to the same file, or the stat error for the source / an unexpected
 *         destination stat failure
 */
FileErrorInfo checkNotSelfCopy(IFilePrimitives& primitives, const std::string& src, const std::string& dst);

} // namespace Steadfast::Core::IO
