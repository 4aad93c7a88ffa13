/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Steadfast Core project.
 */
#include "ElevationChannel.h"
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace Steadfast::Core::IO {

namespace {
    std::string errnoText(const char* what) {
        return std::string(what) + ": " + std::strerror(errno);
    }

    bool fillAddress(const std::string& path, sockaddr_un& addr) {
        std::memset(&addr, 0, sizeof(addr));
        addr.sun_family = AF_UNIX;
        if (path.size() >= sizeof(addr.sun_path)) return false;
        std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);
        return true;
    }
}

void UniqueFd::reset(int fd) noexcept {
    if (_fd >= 0) {
        ::close(_fd);
    }
    _fd = fd;
}

void sendAll(int fd, const char* data, size_t len) {
    size_t sent = 0;
    while (sent < len) {
        ssize_t n = ::send(fd, data + sent, len - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw ChannelError(errnoText("send failed"));
        }
        sent += static_cast<size_t>(n);
    }
}

bool recvAll(int fd, char* data, size_t len) {
    size_t got = 0;
    while (got < len) {
        ssize_t n = ::recv(fd, data + got, len - got, 0);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw ChannelError(errnoText("recv failed"));
        }
        if (n == 0) {
            if (got == 0) return false;
            throw ChannelError("peer closed mid-message");
        }
        got += static_cast<size_t>(n);
    }
    return true;
}

void sendMessage(int fd, ElevationMessageType type, const std::string& payload) {
    if (payload.size() > kElevationMaxPayload) {
        throw ChannelError("payload too large");
    }
    MessageHeader header;
    header.type = static_cast<uint16_t>(type);
    header.length = static_cast<uint32_t>(payload.size());
    std::string frame = encodeHeader(header);
    frame += payload;
    sendAll(fd, frame.data(), frame.size());
}

bool recvMessage(int fd, MessageHeader& header, std::string& payload) {
    std::string raw(kElevationHeaderSize, '\0');
    if (!recvAll(fd, raw.data(), raw.size())) {
        return false;
    }
    auto decoded = decodeHeader(raw);
    if (!decoded) {
        throw ChannelError("invalid message header");
    }
    header = *decoded;
    payload.assign(header.length, '\0');
    if (header.length > 0 && !recvAll(fd, payload.data(), payload.size())) {
        throw ChannelError("peer closed before payload");
    }
    return true;
}

ChannelListener::ChannelListener(std::string socketPath)
    : _path(std::move(socketPath)) {
}

ChannelListener::~ChannelListener() {
    close();
}

std::string ChannelListener::pathFor(const std::filesystem::path& directory, const std::string& sessionId) {
    return (directory / ("steadfast_elevated_" + sessionId + ".sock")).string();
}

std::error_code ChannelListener::listen() {
    sockaddr_un addr{};
    if (!fillAddress(_path, addr)) {
        return std::make_error_code(std::errc::filename_too_long);
    }

    UniqueFd sock(::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!sock.valid()) {
        return {errno, std::generic_category()};
    }

    // A stale socket from a crashed session would make bind fail
    ::unlink(_path.c_str());
    if (::bind(sock.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        return {errno, std::generic_category()};
    }
    _bound = true;

    if (::listen(sock.get(), 1) < 0) {
        int err = errno;
        ::unlink(_path.c_str());
        _bound = false;
        return {err, std::generic_category()};
    }

    _socket = std::move(sock);
    return {};
}

ChannelListener::AcceptResult ChannelListener::acceptFor(std::chrono::milliseconds timeout, UniqueFd& client) {
    if (!_socket.valid()) return AcceptResult::Error;

    pollfd pfd{};
    pfd.fd = _socket.get();
    pfd.events = POLLIN;
    int rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (rc < 0) {
        return errno == EINTR ? AcceptResult::TimedOut : AcceptResult::Error;
    }
    if (rc == 0) return AcceptResult::TimedOut;

    int fd = ::accept4(_socket.get(), nullptr, nullptr, SOCK_CLOEXEC);
    if (fd < 0) {
        return (errno == EINTR || errno == EAGAIN) ? AcceptResult::TimedOut : AcceptResult::Error;
    }
    client.reset(fd);
    return AcceptResult::Accepted;
}

void ChannelListener::close() noexcept {
    _socket.reset();
    if (_bound) {
        ::unlink(_path.c_str());
        _bound = false;
    }
}

UniqueFd connectChannel(const std::string& socketPath, std::error_code& ec) {
    ec.clear();
    sockaddr_un addr{};
    if (!fillAddress(socketPath, addr)) {
        ec = std::make_error_code(std::errc::filename_too_long);
        return {};
    }
    UniqueFd sock(::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!sock.valid()) {
        ec = {errno, std::generic_category()};
        return {};
    }
    while (::connect(sock.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        if (errno == EINTR) continue;
        ec = {errno, std::generic_category()};
        return {};
    }
    return sock;
}

std::optional<uint32_t> peerUserId(int fd, std::error_code& ec) {
    ec.clear();
    ucred cred{};
    socklen_t len = sizeof(cred);
    if (::getsockopt(fd, SOL_SOCKET, SO_PEERCRED, &cred, &len) != 0) {
        ec = {errno, std::generic_category()};
        return std::nullopt;
    }
    return static_cast<uint32_t>(cred.uid);
}

} // namespace Steadfast::Core::IO
