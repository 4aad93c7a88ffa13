/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Steadfast Core project.
 */

/**
 * @file ElevationMessages.h
 * @brief Typed messages exchanged with the elevated helper and their wire encoding
 *
 * Every message is a 16-byte header followed by the payload:
 *   magic 'STDF' (u32) | version (u16) | type (u16) | payload length (u32) | reserved (u32)
 * Integers are little-endian. Strings are a u32 length followed by the bytes.
 *
 * Request payload:  action (u8) | userId (u32) | sessionId (str) | path (str)
 * Response payload: success (u8) | errno (i32) | message (str)
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace Steadfast::Core::IO {

constexpr uint32_t kElevationMagic = 0x53544446;   // 'STDF'
constexpr uint16_t kElevationProtocolVersion = 1;
constexpr size_t kElevationHeaderSize = 16;
constexpr uint32_t kElevationMaxPayload = 64 * 1024;

enum class ElevationMessageType : uint16_t {
    Request = 1,
    Response = 2
};

enum class ElevationAction : uint8_t {
    GrantAccess = 1,        ///< give the user rwx on the path (parent directory when the path is gone)
    EnsureDirectory = 2     ///< create the directory tree, then grant as above
};

const char* elevationActionName(ElevationAction action) noexcept;

struct ElevationRequest {
    ElevationAction action = ElevationAction::GrantAccess;
    std::string path;
    uint32_t userId = 0;
    std::string sessionId;

    bool operator==(const ElevationRequest&) const = default;
};

struct ElevationResponse {
    bool success = false;
    int32_t errorNumber = 0;
    std::string message;

    bool operator==(const ElevationResponse&) const = default;
};

struct MessageHeader {
    uint32_t magic = kElevationMagic;
    uint16_t version = kElevationProtocolVersion;
    uint16_t type = 0;
    uint32_t length = 0;
    uint32_t reserved = 0;
};

std::string encodeHeader(const MessageHeader& header);
// Rejects a wrong magic/version or an oversized payload
std::optional<MessageHeader> decodeHeader(std::string_view bytes);

std::string encodeRequest(const ElevationRequest& request);
std::optional<ElevationRequest> decodeRequest(std::string_view payload);

std::string encodeResponse(const ElevationResponse& response);
std::optional<ElevationResponse> decodeResponse(std::string_view payload);

} // namespace Steadfast::Core::IO
