/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Steadfast Core project.
 */

/**
 * @file RecoveryPrompts.h
 * @brief User decision points offered when an operation hits a busy or protected path
 *
 * ResilientFileSystem asks the injected IRecoveryPrompt and blocks only the operation that
 * needs the answer. Without an interactive surface the NonInteractivePrompt proceeds as if
 * the user had chosen Retry; the file system bounds those unattended retries.
 */
#pragma once
#include <iosfwd>
#include <mutex>
#include <string>

namespace Steadfast::Core::IO {

enum class BusyChoice { Cancel, Retry };
enum class AccessDeniedChoice { Cancel, Retry, GrantPermission };

const char* busyChoiceName(BusyChoice choice) noexcept;
const char* accessDeniedChoiceName(AccessDeniedChoice choice) noexcept;

class IRecoveryPrompt {
public:
    virtual ~IRecoveryPrompt() = default;

    // False when nobody can answer; choices are then automatic
    virtual bool isInteractive() const = 0;

    /**
     * @brief The path is open in another application
     * @return Cancel aborts the whole operation, Retry tries again now
     */
    virtual BusyChoice confirmBusyRetry(const std::string& path) = 0;

    /**
     * @brief The path needs permissions the process does not have
     * @return Cancel aborts, Retry tries again without elevation, GrantPermission runs the
     *         elevated helper against the path before retrying
     */
    virtual AccessDeniedChoice confirmAccessDenied(const std::string& path) = 0;
};

class NonInteractivePrompt : public IRecoveryPrompt {
public:
    bool isInteractive() const override { return false; }
    BusyChoice confirmBusyRetry(const std::string&) override { return BusyChoice::Retry; }
    AccessDeniedChoice confirmAccessDenied(const std::string&) override { return AccessDeniedChoice::Retry; }
};

/**
 * @brief Text prompt on a terminal
 *
 * Prompts from concurrent operations are serialized so questions never interleave.
 * End of input counts as Cancel.
 */
class ConsolePrompt : public IRecoveryPrompt {
public:
    ConsolePrompt();
    ConsolePrompt(std::istream& in, std::ostream& out);

    bool isInteractive() const override { return true; }
    BusyChoice confirmBusyRetry(const std::string& path) override;
    AccessDeniedChoice confirmAccessDenied(const std::string& path) override;

private:
    std::istream* _in;
    std::ostream* _out;
    std::mutex _mutex;
};

} // namespace Steadfast::Core::IO
