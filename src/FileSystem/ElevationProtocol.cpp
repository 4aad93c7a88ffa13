/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Steadfast Core project.
 */
#include "ElevationProtocol.h"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <format>
#include <random>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
#include "../CoreCommon.h"
#include "../Logging/Logger.h"
#include "ElevationChannel.h"
#include "ErrorClassifier.h"

namespace Steadfast::Core::IO {

namespace {
    int decodeWaitStatus(int status) {
        if (WIFEXITED(status)) return WEXITSTATUS(status);
        if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
        return -1;
    }

    class PosixProcess : public IElevatedProcess {
    public:
        explicit PosixProcess(pid_t pid) : _pid(pid) {}

        ~PosixProcess() override {
            if (!_exitCode) {
                terminate();
                wait();
            }
        }

        std::optional<int> tryWait() override {
            if (_exitCode) return _exitCode;
            int status = 0;
            pid_t rc = ::waitpid(_pid, &status, WNOHANG);
            if (rc == _pid) {
                _exitCode = decodeWaitStatus(status);
            } else if (rc < 0 && errno != EINTR) {
                _exitCode = -1;
            }
            return _exitCode;
        }

        int wait() override {
            while (!_exitCode) {
                int status = 0;
                pid_t rc = ::waitpid(_pid, &status, 0);
                if (rc == _pid) {
                    _exitCode = decodeWaitStatus(status);
                } else if (rc < 0 && errno != EINTR) {
                    _exitCode = -1;
                }
            }
            return *_exitCode;
        }

        void terminate() override {
            if (!_exitCode) ::kill(_pid, SIGTERM);
        }

    private:
        pid_t _pid;
        std::optional<int> _exitCode;
    };
}

const char* elevationStateName(ElevationState state) noexcept {
    switch (state) {
        case ElevationState::Idle: return "Idle";
        case ElevationState::ChannelListening: return "ChannelListening";
        case ElevationState::ElevatedProcessRequested: return "ElevatedProcessRequested";
        case ElevationState::Connected: return "Connected";
        case ElevationState::Completed: return "Completed";
        case ElevationState::Canceled: return "Canceled";
        case ElevationState::Disconnected: return "Disconnected";
    }
    return "Unknown";
}

ProcessLauncher::ProcessLauncher(std::string helperPath, std::vector<std::string> prefix)
    : _helperPath(std::move(helperPath))
    , _prefix(std::move(prefix)) {
}

std::unique_ptr<IElevatedProcess> ProcessLauncher::launch(const std::string& channelPath, std::error_code& ec) {
    return spawn(_helperPath, channelPath, ec);
}

std::unique_ptr<IElevatedProcess> ProcessLauncher::spawn(const std::string& helper, const std::string& channelPath,
                                                         std::error_code& ec) {
    ec.clear();

    // Everything the child touches is prepared before fork
    std::vector<std::string> args = _prefix;
    args.push_back(helper);
    args.push_back("--channel");
    args.push_back(channelPath);
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);

    // Reports an exec failure back to the parent; closed automatically on a successful exec
    int errPipe[2];
    if (::pipe2(errPipe, O_CLOEXEC) != 0) {
        ec = {errno, std::generic_category()};
        return nullptr;
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        ec = {errno, std::generic_category()};
        ::close(errPipe[0]);
        ::close(errPipe[1]);
        return nullptr;
    }

    if (pid == 0) {
        ::close(errPipe[0]);
        ::execvp(argv[0], argv.data());
        int err = errno;
        ssize_t ignored = ::write(errPipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    ::close(errPipe[1]);
    int childErr = 0;
    ssize_t n;
    do {
        n = ::read(errPipe[0], &childErr, sizeof(childErr));
    } while (n < 0 && errno == EINTR);
    ::close(errPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(childErr))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        ec = {childErr, std::generic_category()};
        return nullptr;
    }

    return std::make_unique<PosixProcess>(pid);
}

PkexecLauncher::PkexecLauncher(std::string helperPath)
    : ProcessLauncher(std::move(helperPath), {"pkexec"}) {
}

std::unique_ptr<IElevatedProcess> PkexecLauncher::launch(const std::string& channelPath, std::error_code& ec) {
    // pkexec exits 127 for a helper it cannot run as well as for a refusal
    auto helper = resolveExecutable(helperPath());
    if (!helper) {
        ec = std::make_error_code(std::errc::no_such_file_or_directory);
        STEADFAST_LOG_ERROR_CAT("Elevation", std::format("Elevated helper '{}' is not an executable file", helperPath()));
        return nullptr;
    }
    return spawn(*helper, channelPath, ec);
}

std::optional<std::string> resolveExecutable(const std::string& program) {
    auto runnable = [](const std::filesystem::path& p) {
        std::error_code ec;
        return std::filesystem::is_regular_file(p, ec) && ::access(p.c_str(), X_OK) == 0;
    };

    if (program.empty()) return std::nullopt;
    if (program.find('/') != std::string::npos) {
        std::error_code ec;
        auto absolute = std::filesystem::absolute(program, ec);
        if (ec || !runnable(absolute)) return std::nullopt;
        return absolute.string();
    }

    auto path = safeGetEnv("PATH");
    if (!path) return std::nullopt;
    size_t start = 0;
    while (start <= path->size()) {
        size_t end = path->find(':', start);
        if (end == std::string::npos) end = path->size();
        std::filesystem::path dir = path->substr(start, end - start);
        if (dir.empty()) dir = ".";
        auto candidate = dir / program;
        if (runnable(candidate)) {
            std::error_code ec;
            auto absolute = std::filesystem::absolute(candidate, ec);
            return ec ? candidate.string() : absolute.string();
        }
        start = end + 1;
    }
    return std::nullopt;
}

ElevationConfig::ElevationConfig()
    : helperPath("steadfast-elevated")
    , pollInterval(50) {
    if (auto helper = safeGetEnv("STEADFAST_ELEVATED_HELPER"); helper && !helper->empty()) {
        helperPath = *helper;
    }
    if (auto runtimeDir = safeGetEnv("XDG_RUNTIME_DIR"); runtimeDir && !runtimeDir->empty()) {
        channelDirectory = *runtimeDir;
    } else {
        std::error_code ec;
        channelDirectory = std::filesystem::temp_directory_path(ec);
        if (ec) channelDirectory = "/tmp";
    }
}

ElevationSession::ElevationSession(std::string sessionId, ElevationRequest request,
                                   IElevationLauncher& launcher, const ElevationConfig& config)
    : _sessionId(std::move(sessionId))
    , _request(std::move(request))
    , _launcher(launcher)
    , _config(config) {
    _request.sessionId = _sessionId;
}

void ElevationSession::transition(ElevationState next) {
    STEADFAST_LOG_DEBUG_CAT("Elevation", std::format("Session {}: {} -> {}", _sessionId,
                                                     elevationStateName(_state), elevationStateName(next)));
    _state = next;
    _transitions.push_back(next);
}

FileErrorInfo ElevationSession::channelError(const std::string& message) const {
    FileErrorInfo err;
    err.code = FileError::ElevationChannelError;
    err.message = message;
    err.path = _request.path;
    return err;
}

ElevationOutcome ElevationSession::finish(ElevationState terminal, FileErrorInfo error) {
    transition(terminal);
    ElevationOutcome outcome;
    outcome.finalState = terminal;
    outcome.error = std::move(error);
    outcome.sessionId = _sessionId;
    return outcome;
}

ElevationOutcome ElevationSession::finishWithoutReport(int exitCode) {
    if (_launcher.isRejection(exitCode)) {
        FileErrorInfo err;
        err.code = FileError::ElevationRejected;
        err.message = std::format("Elevation was refused ({} exited with code {})", _launcher.name(), exitCode);
        err.path = _request.path;
        return finish(ElevationState::Canceled, std::move(err));
    }
    if (exitCode == 0) {
        return finish(ElevationState::Disconnected, {});
    }
    return finish(ElevationState::Disconnected,
                  channelError(std::format("Elevated helper exited with code {} without a report", exitCode)));
}

ElevationOutcome ElevationSession::run() {
    ChannelListener listener(ChannelListener::pathFor(_config.channelDirectory, _sessionId));
    if (auto ec = listener.listen()) {
        return finish(ElevationState::Disconnected,
                      channelError("Cannot open channel " + listener.path() + ": " + ec.message()));
    }
    transition(ElevationState::ChannelListening);

    std::error_code launchError;
    auto process = _launcher.launch(listener.path(), launchError);
    if (!process) {
        return finish(ElevationState::Disconnected,
                      channelError("Cannot start elevated helper: " + launchError.message()));
    }
    transition(ElevationState::ElevatedProcessRequested);

    UniqueFd client;
    const auto started = std::chrono::steady_clock::now();
    for (;;) {
        auto result = listener.acceptFor(_config.pollInterval, client);
        if (result == ChannelListener::AcceptResult::Accepted) break;

        if (result == ChannelListener::AcceptResult::Error) {
            process->terminate();
            process->wait();
            return finish(ElevationState::Disconnected, channelError("Accept failed on " + listener.path()));
        }

        if (auto exitCode = process->tryWait()) {
            return finishWithoutReport(*exitCode);
        }

        if (_config.connectTimeout &&
            std::chrono::steady_clock::now() - started >= *_config.connectTimeout) {
            process->terminate();
            process->wait();
            return finish(ElevationState::Disconnected,
                          channelError(std::format("Elevated helper did not connect within {}ms",
                                                   _config.connectTimeout->count())));
        }
    }

    // One connection per session
    listener.close();
    transition(ElevationState::Connected);

    std::optional<ElevationResponse> response;
    try {
        sendMessage(client.get(), ElevationMessageType::Request, encodeRequest(_request));
        MessageHeader header;
        std::string payload;
        if (recvMessage(client.get(), header, payload)) {
            if (header.type != static_cast<uint16_t>(ElevationMessageType::Response)) {
                throw ChannelError("unexpected message type " + std::to_string(header.type));
            }
            response = decodeResponse(payload);
            if (!response) {
                throw ChannelError("malformed response");
            }
        }
    } catch (const ChannelError& e) {
        // Closing our end lets the helper notice and exit
        client.reset();
        process->wait();
        return finish(ElevationState::Disconnected, channelError(std::string("Channel failure: ") + e.what()));
    }

    client.reset();
    int exitCode = process->wait();
    if (!response) {
        return finishWithoutReport(exitCode);
    }

    if (response->success) {
        return finish(ElevationState::Completed, {});
    }

    FileErrorInfo err;
    if (response->errorNumber != 0) {
        err = makeOsError(response->errorNumber, _request.path);
        err.message = response->message;
    } else {
        err.code = FileError::IOError;
        err.message = response->message;
        err.path = _request.path;
    }
    return finish(ElevationState::Completed, std::move(err));
}

ElevationService::ElevationService(Config config, std::shared_ptr<IElevationLauncher> launcher)
    : _config(std::move(config))
    , _launcher(std::move(launcher)) {
    if (!_launcher) {
        _launcher = std::make_shared<PkexecLauncher>(_config.helperPath);
    }
}

std::string ElevationService::generateSessionId() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    return std::format("{:016x}", rng());
}

std::string ElevationService::reserveSessionId() {
    std::lock_guard<std::mutex> lock(_sessionMutex);
    for (;;) {
        auto id = generateSessionId();
        if (_activeSessions.insert(id).second) return id;
    }
}

void ElevationService::releaseSessionId(const std::string& id) {
    std::lock_guard<std::mutex> lock(_sessionMutex);
    _activeSessions.erase(id);
}

size_t ElevationService::activeSessionCount() const {
    std::lock_guard<std::mutex> lock(_sessionMutex);
    return _activeSessions.size();
}

ElevationOutcome ElevationService::elevate(const ElevationRequest& request) {
    const std::string id = reserveSessionId();
    STEADFAST_LOG_INFO_CAT("Elevation", std::format("Session {}: {} '{}' via {}", id,
                                                    elevationActionName(request.action), request.path,
                                                    _launcher->name()));

    ElevationSession session(id, request, *_launcher, _config);
    ElevationOutcome outcome = session.run();
    releaseSessionId(id);

    if (outcome.succeeded()) {
        STEADFAST_LOG_INFO_CAT("Elevation", std::format("Session {} finished in {}", id,
                                                        elevationStateName(outcome.finalState)));
    } else {
        STEADFAST_LOG_WARNING_CAT("Elevation", std::format("Session {} finished in {}: {} ({})", id,
                                                           elevationStateName(outcome.finalState),
                                                           outcome.error.message,
                                                           fileErrorToString(outcome.error.code)));
    }
    return outcome;
}

} // namespace Steadfast::Core::IO
