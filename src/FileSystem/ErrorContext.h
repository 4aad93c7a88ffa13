/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Steadfast Core project.
 */

/**
 * @file ErrorContext.h
 * @brief Call-site capture for asynchronous file operations
 *
 * OS errors reach the caller from a worker thread with no useful origin. Every public
 * operation captures an ErrorContext where the caller invoked it (via a defaulted
 * std::source_location argument) and merges it into any error that leaves the layer.
 *
 * @code
 * ErrorContext ctx("rename");               // captures the current call site
 * ctx.enrich(error);
 * // error.trace == "rename failed: Permission denied\n    at main (app.cpp:42:5)"
 * @endcode
 */
#pragma once
#include <source_location>
#include <string>
#include <thread>
#include "FileOperationHandle.h"

namespace Steadfast::Core::IO {

class ErrorContext {
public:
    explicit ErrorContext(std::string operation,
                          std::source_location origin = std::source_location::current());

    const std::string& operation() const noexcept { return _operation; }
    const std::source_location& origin() const noexcept { return _origin; }
    std::thread::id callerThread() const noexcept { return _callerThread; }

    // "at <function> (<file>:<line>:<column>)"
    std::string callSite() const;

    // Builds "<operation> failed: <message>" followed by the captured call site
    std::string describe(const FileErrorInfo& error) const;

    // Replaces error.trace with describe(error); the code, message and path are untouched
    void enrich(FileErrorInfo& error) const;

private:
    std::string _operation;
    std::source_location _origin;
    std::thread::id _callerThread;
};

} // namespace Steadfast::Core::IO
