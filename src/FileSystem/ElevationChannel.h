/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Steadfast Core project.
 */

/**
 * @file ElevationChannel.h
 * @brief Unix domain socket channel between a session and its elevated helper
 *
 * The session side owns a ChannelListener bound to a per-session socket path.
 * The helper connects with connectChannel(). Both sides exchange framed messages
 * with sendMessage()/recvMessage(). Transport failures throw ChannelError.
 */
#pragma once
#include "ElevationMessages.h"
#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <optional>
#include <string>
#include <system_error>

namespace Steadfast::Core::IO {

class ChannelError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Owns a file descriptor and closes it on destruction
 */
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) noexcept : _fd(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;
    UniqueFd(UniqueFd&& other) noexcept : _fd(other.release()) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) reset(other.release());
        return *this;
    }

    int get() const noexcept { return _fd; }
    bool valid() const noexcept { return _fd >= 0; }
    int release() noexcept { int fd = _fd; _fd = -1; return fd; }
    void reset(int fd = -1) noexcept;

private:
    int _fd = -1;
};

void sendAll(int fd, const char* data, size_t len);
// Returns false if the peer closed before any byte arrived
bool recvAll(int fd, char* data, size_t len);

void sendMessage(int fd, ElevationMessageType type, const std::string& payload);
// Returns false on an orderly close before a header arrived
bool recvMessage(int fd, MessageHeader& header, std::string& payload);

class ChannelListener {
public:
    enum class AcceptResult {
        Accepted,
        TimedOut,
        Error
    };

    explicit ChannelListener(std::string socketPath);
    ~ChannelListener();

    ChannelListener(const ChannelListener&) = delete;
    ChannelListener& operator=(const ChannelListener&) = delete;

    /// Socket path used for a session id under the given directory
    static std::string pathFor(const std::filesystem::path& directory, const std::string& sessionId);

    std::error_code listen();
    AcceptResult acceptFor(std::chrono::milliseconds timeout, UniqueFd& client);
    void close() noexcept;

    const std::string& path() const noexcept { return _path; }
    bool isListening() const noexcept { return _socket.valid(); }

private:
    std::string _path;
    UniqueFd _socket;
    bool _bound = false;
};

UniqueFd connectChannel(const std::string& socketPath, std::error_code& ec);

/**
 * @brief User id of the process on the other end of a connected channel
 *
 * Reported by the kernel (SO_PEERCRED), so the peer cannot forge it. For the helper's
 * socket this is the session owner that bound and listened on the channel.
 */
std::optional<uint32_t> peerUserId(int fd, std::error_code& ec);

} // namespace Steadfast::Core::IO
