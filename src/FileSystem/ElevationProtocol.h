/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Steadfast Core project.
 */

/**
 * @file ElevationProtocol.h
 * @brief Runs privileged work in a separate elevated helper process
 *
 * Each elevation is a session with its own uniquely named channel:
 *
 *   Idle -> ChannelListening -> ElevatedProcessRequested -> Connected -> Completed
 *                                         |                    |
 *                                         +--> Canceled        +--> Disconnected
 *                                         +--> Disconnected
 *
 * Canceled means the OS refused to elevate (the authorization dialog was dismissed).
 * Disconnected means the helper went away without a report; a clean exit counts as
 * success, anything else is an ElevationChannelError. Completed carries the helper's
 * own result.
 *
 * The session blocks the calling thread until it reaches a terminal state. Concurrent
 * sessions never share a channel.
 */
#pragma once
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <system_error>
#include <vector>
#include <sys/types.h>
#include "ElevationMessages.h"
#include "FileOperationHandle.h"

namespace Steadfast::Core::IO {

enum class ElevationState {
    Idle,
    ChannelListening,
    ElevatedProcessRequested,
    Connected,
    Completed,
    Canceled,
    Disconnected
};

const char* elevationStateName(ElevationState state) noexcept;

struct ElevationOutcome {
    ElevationState finalState = ElevationState::Idle;
    FileErrorInfo error;            ///< code None when the request took effect
    std::string sessionId;

    bool succeeded() const noexcept { return error.ok(); }
};

/**
 * @brief A launched helper process
 */
class IElevatedProcess {
public:
    virtual ~IElevatedProcess() = default;

    // Exit code if the process has finished, without blocking
    virtual std::optional<int> tryWait() = 0;
    // Blocks until the process finishes and returns its exit code
    virtual int wait() = 0;
    virtual void terminate() = 0;
};

class IElevationLauncher {
public:
    virtual ~IElevationLauncher() = default;

    /**
     * @brief Starts the helper pointed at the session channel
     * @return nullptr with ec set when the process could not be started
     */
    virtual std::unique_ptr<IElevatedProcess> launch(const std::string& channelPath, std::error_code& ec) = 0;

    // True when an exit code means the OS refused the elevation
    virtual bool isRejection(int exitCode) const = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief fork/exec of the helper, optionally behind a command prefix
 *
 * The helper is invoked as `<prefix...> <helperPath> --channel <channelPath>`.
 */
class ProcessLauncher : public IElevationLauncher {
public:
    explicit ProcessLauncher(std::string helperPath, std::vector<std::string> prefix = {});

    std::unique_ptr<IElevatedProcess> launch(const std::string& channelPath, std::error_code& ec) override;
    bool isRejection(int) const override { return false; }
    std::string name() const override { return "process"; }

    const std::string& helperPath() const noexcept { return _helperPath; }

protected:
    // Runs <prefix...> <helper> --channel <channelPath>
    std::unique_ptr<IElevatedProcess> spawn(const std::string& helper, const std::string& channelPath,
                                            std::error_code& ec);

private:
    std::string _helperPath;
    std::vector<std::string> _prefix;
};

/**
 * @brief Launches the helper through polkit's pkexec
 *
 * pkexec exits with 126 when the authorization dialog is dismissed and 127 when
 * authorization could not be obtained. pkexec also exits 127 when it cannot run the
 * helper, so launch() checks the helper first and fails with no_such_file_or_directory
 * instead of starting pkexec.
 */
class PkexecLauncher : public ProcessLauncher {
public:
    explicit PkexecLauncher(std::string helperPath);

    std::unique_ptr<IElevatedProcess> launch(const std::string& channelPath, std::error_code& ec) override;

    bool isRejection(int exitCode) const override { return exitCode == 126 || exitCode == 127; }
    std::string name() const override { return "pkexec"; }
};

/**
 * @brief Absolute path of an executable regular file
 *
 * A program containing '/' is checked as given; a bare name is searched for on PATH.
 * Returns std::nullopt when nothing runnable is found.
 */
std::optional<std::string> resolveExecutable(const std::string& program);

/**
 * @brief Settings for elevation sessions
 * @param helperPath Helper executable; STEADFAST_ELEVATED_HELPER overrides the default
 * @param channelDirectory Where session sockets are created; XDG_RUNTIME_DIR, else the temp directory
 * @param pollInterval How often the session checks for a connection or an early exit
 * @param connectTimeout Give up on a helper that neither connects nor exits; unset waits indefinitely
 */
struct ElevationConfig {
    std::string helperPath;
    std::filesystem::path channelDirectory;
    std::chrono::milliseconds pollInterval;
    std::optional<std::chrono::milliseconds> connectTimeout;

    ElevationConfig();
};

/**
 * @brief One request, one channel, one helper process
 */
class ElevationSession {
public:
    ElevationSession(std::string sessionId, ElevationRequest request,
                     IElevationLauncher& launcher, const ElevationConfig& config);

    ElevationOutcome run();

    ElevationState state() const noexcept { return _state; }
    const std::vector<ElevationState>& transitions() const noexcept { return _transitions; }
    const std::string& sessionId() const noexcept { return _sessionId; }

private:
    void transition(ElevationState next);
    ElevationOutcome finish(ElevationState terminal, FileErrorInfo error);
    ElevationOutcome finishWithoutReport(int exitCode);
    FileErrorInfo channelError(const std::string& message) const;

    std::string _sessionId;
    ElevationRequest _request;
    IElevationLauncher& _launcher;
    const ElevationConfig& _config;
    ElevationState _state = ElevationState::Idle;
    std::vector<ElevationState> _transitions;
};

class IElevationService {
public:
    virtual ~IElevationService() = default;

    // Blocks until the request has been carried out, refused, or lost
    virtual ElevationOutcome elevate(const ElevationRequest& request) = 0;
};

class ElevationService : public IElevationService {
public:
    using Config = ElevationConfig;

    explicit ElevationService(Config config = Config(), std::shared_ptr<IElevationLauncher> launcher = nullptr);

    ElevationOutcome elevate(const ElevationRequest& request) override;

    size_t activeSessionCount() const;
    const Config& config() const noexcept { return _config; }

    // 16 lowercase hex characters
    static std::string generateSessionId();

private:
    std::string reserveSessionId();
    void releaseSessionId(const std::string& id);

    Config _config;
    std::shared_ptr<IElevationLauncher> _launcher;
    mutable std::mutex _sessionMutex;
    std::set<std::string> _activeSessions;
};

} // namespace Steadfast::Core::IO
