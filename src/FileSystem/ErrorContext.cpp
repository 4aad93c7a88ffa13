/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Steadfast Core project.
 */
#include "ErrorContext.h"
#include <format>

namespace Steadfast::Core::IO {

ErrorContext::ErrorContext(std::string operation, std::source_location origin)
    : _operation(std::move(operation))
    , _origin(origin)
    , _callerThread(std::this_thread::get_id()) {
}

std::string ErrorContext::callSite() const {
    return std::format("at {} ({}:{}:{})",
                       _origin.function_name(), _origin.file_name(), _origin.line(), _origin.column());
}

std::string ErrorContext::describe(const FileErrorInfo& error) const {
    std::string message = error.message;
    if (message.empty() && error.systemError) {
        message = error.systemError->message();
    }
    if (message.empty()) {
        message = fileErrorToString(error.code);
    }
    std::string trace = std::format("{} failed: {}", _operation, message);
    if (!error.path.empty()) {
        trace += std::format(" [{}]", error.path);
    }
    trace += "\n    ";
    trace += callSite();
    return trace;
}

void ErrorContext::enrich(FileErrorInfo& error) const {
    error.trace = describe(error);
}

} // namespace Steadfast::Core::IO
