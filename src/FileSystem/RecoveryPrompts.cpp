/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Steadfast Core project.
 */
#include "RecoveryPrompts.h"
#include <iostream>
#include "../Logging/Logger.h"

namespace Steadfast::Core::IO {

const char* busyChoiceName(BusyChoice choice) noexcept {
    return choice == BusyChoice::Retry ? "Retry" : "Cancel";
}

const char* accessDeniedChoiceName(AccessDeniedChoice choice) noexcept {
    switch (choice) {
        case AccessDeniedChoice::Cancel: return "Cancel";
        case AccessDeniedChoice::Retry: return "Retry";
        case AccessDeniedChoice::GrantPermission: return "GrantPermission";
    }
    return "Cancel";
}

ConsolePrompt::ConsolePrompt()
    : _in(&std::cin)
    , _out(&std::cout) {
}

ConsolePrompt::ConsolePrompt(std::istream& in, std::ostream& out)
    : _in(&in)
    , _out(&out) {
}

BusyChoice ConsolePrompt::confirmBusyRetry(const std::string& path) {
    std::lock_guard<std::mutex> lock(_mutex);
    STEADFAST_LOG_INFO_CAT("RecoveryPrompt", "File busy prompt for " + path);
    for (;;) {
        *_out << "File busy\n"
              << "\"" << path << "\" is open in another application.\n"
              << "Please close the file in all other applications and then retry.\n"
              << "[c]ancel / [r]etry: " << std::flush;
        std::string answer;
        if (!std::getline(*_in, answer)) return BusyChoice::Cancel;
        if (answer == "c" || answer == "cancel") return BusyChoice::Cancel;
        if (answer == "r" || answer == "retry") return BusyChoice::Retry;
    }
}

AccessDeniedChoice ConsolePrompt::confirmAccessDenied(const std::string& path) {
    std::lock_guard<std::mutex> lock(_mutex);
    STEADFAST_LOG_INFO_CAT("RecoveryPrompt", "Access denied prompt for " + path);
    for (;;) {
        *_out << "Access denied\n"
              << "Access to \"" << path << "\" was denied.\n"
              << "If your account has administrator rights the permission can be granted for you;\n"
              << "the system will ask you to authenticate.\n"
              << "[c]ancel / [r]etry / [g]rant permission: " << std::flush;
        std::string answer;
        if (!std::getline(*_in, answer)) return AccessDeniedChoice::Cancel;
        if (answer == "c" || answer == "cancel") return AccessDeniedChoice::Cancel;
        if (answer == "r" || answer == "retry") return AccessDeniedChoice::Retry;
        if (answer == "g" || answer == "grant") return AccessDeniedChoice::GrantPermission;
    }
}

} // namespace Steadfast::Core::IO
