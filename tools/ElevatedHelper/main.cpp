/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Steadfast Core project.
 */

/**
 * @file main.cpp
 * @brief steadfast-elevated: performs one privileged filesystem action for a session
 *
 * Usage: steadfast-elevated --channel <socket path>
 *
 * Launched (normally through pkexec) by ElevationService. Connects back to the session
 * channel, reads exactly one request, executes it and replies with the result.
 *
 * The user granted access is the uid of the process that owns the channel, as reported
 * by the kernel. When pkexec launched the helper, PKEXEC_UID must name the same user.
 * The uid carried in the request is ignored.
 *
 * Exit codes: 0 the request was answered, 2 bad usage, 3 channel failure.
 */
#include <cerrno>
#include <charconv>
#include <cstring>
#include <format>
#include <iostream>
#include <optional>
#include <string>
#include "CoreCommon.h"
#include "FileSystem/ElevatedActions.h"
#include "FileSystem/ElevationChannel.h"
#include "FileSystem/ElevationMessages.h"
#include "Logging/Logger.h"

using namespace Steadfast::Core::IO;

namespace {
    constexpr int kExitUsage = 2;
    constexpr int kExitChannel = 3;

    void printUsage(const char* argv0) {
        std::cerr << "Usage: " << argv0 << " --channel <socket path>\n";
    }

    // The session owner's uid, or nullopt when it cannot be established
    std::optional<uint32_t> resolveGrantee(int channelFd) {
        std::error_code ec;
        auto peer = peerUserId(channelFd, ec);
        if (!peer) {
            STEADFAST_LOG_ERROR_CAT("ElevatedHelper", "Cannot read channel peer credentials: " + ec.message());
            return std::nullopt;
        }

        if (auto invoker = Steadfast::Core::safeGetEnv("PKEXEC_UID")) {
            uint32_t uid = 0;
            auto [end, err] = std::from_chars(invoker->data(), invoker->data() + invoker->size(), uid);
            if (err != std::errc() || end != invoker->data() + invoker->size() || uid != *peer) {
                STEADFAST_LOG_ERROR_CAT("ElevatedHelper",
                    std::format("PKEXEC_UID '{}' does not match channel owner {}", *invoker, *peer));
                return std::nullopt;
            }
        }
        return peer;
    }
}

int main(int argc, char** argv) {
    std::string channelPath;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--channel") == 0 && i + 1 < argc) {
            channelPath = argv[++i];
        } else if (std::strcmp(argv[i], "--help") == 0) {
            printUsage(argv[0]);
            return 0;
        } else {
            printUsage(argv[0]);
            return kExitUsage;
        }
    }
    if (channelPath.empty()) {
        printUsage(argv[0]);
        return kExitUsage;
    }

    std::error_code ec;
    UniqueFd channel = connectChannel(channelPath, ec);
    if (!channel.valid()) {
        STEADFAST_LOG_ERROR_CAT("ElevatedHelper", std::format("Cannot connect to {}: {}", channelPath, ec.message()));
        return kExitChannel;
    }

    try {
        MessageHeader header;
        std::string payload;
        if (!recvMessage(channel.get(), header, payload)) {
            STEADFAST_LOG_WARNING_CAT("ElevatedHelper", "Session closed before sending a request");
            return kExitChannel;
        }

        ElevationResponse response;
        auto request = header.type == static_cast<uint16_t>(ElevationMessageType::Request)
            ? decodeRequest(payload)
            : std::nullopt;
        if (!request) {
            response.success = false;
            response.errorNumber = EINVAL;
            response.message = "Malformed elevation request";
        } else if (auto grantee = resolveGrantee(channel.get()); !grantee) {
            response.success = false;
            response.errorNumber = EPERM;
            response.message = "Cannot verify the requesting user";
        } else {
            if (request->userId != *grantee) {
                STEADFAST_LOG_WARNING_CAT("ElevatedHelper",
                    std::format("Session {}: ignoring claimed uid {}, channel owner is {}",
                                request->sessionId, request->userId, *grantee));
            }
            STEADFAST_LOG_INFO_CAT("ElevatedHelper", std::format("Session {}: {} '{}' for uid {}", request->sessionId,
                                                                 elevationActionName(request->action), request->path,
                                                                 *grantee));
            response = executeElevatedRequest(*request, *grantee);
        }

        sendMessage(channel.get(), ElevationMessageType::Response, encodeResponse(response));
    } catch (const ChannelError& e) {
        STEADFAST_LOG_ERROR_CAT("ElevatedHelper", std::string("Channel failure: ") + e.what());
        return kExitChannel;
    }

    Steadfast::Core::Logging::Logger::global().flush();
    return 0;
}
