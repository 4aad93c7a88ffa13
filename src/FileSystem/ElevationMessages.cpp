/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Steadfast Core project.
 */
#include "ElevationMessages.h"

namespace Steadfast::Core::IO {

namespace {
    void putU8(std::string& out, uint8_t v) {
        out.push_back(static_cast<char>(v));
    }

    void putU16(std::string& out, uint16_t v) {
        out.push_back(static_cast<char>(v & 0xFF));
        out.push_back(static_cast<char>((v >> 8) & 0xFF));
    }

    void putU32(std::string& out, uint32_t v) {
        for (int i = 0; i < 4; ++i) {
            out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
        }
    }

    void putString(std::string& out, std::string_view s) {
        putU32(out, static_cast<uint32_t>(s.size()));
        out.append(s.data(), s.size());
    }

    // Bounds-checked little-endian reader
    class Reader {
    public:
        explicit Reader(std::string_view data) : _data(data) {}

        bool u8(uint8_t& v) {
            if (_pos + 1 > _data.size()) return false;
            v = static_cast<uint8_t>(_data[_pos++]);
            return true;
        }

        bool u16(uint16_t& v) {
            if (_pos + 2 > _data.size()) return false;
            v = static_cast<uint16_t>(byteAt(0) | (byteAt(1) << 8));
            _pos += 2;
            return true;
        }

        bool u32(uint32_t& v) {
            if (_pos + 4 > _data.size()) return false;
            v = 0;
            for (int i = 0; i < 4; ++i) {
                v |= static_cast<uint32_t>(byteAt(i)) << (8 * i);
            }
            _pos += 4;
            return true;
        }

        bool str(std::string& s) {
            uint32_t len = 0;
            if (!u32(len)) return false;
            if (len > _data.size() - _pos) return false;
            s.assign(_data.substr(_pos, len));
            _pos += len;
            return true;
        }

        bool atEnd() const noexcept { return _pos == _data.size(); }

    private:
        uint32_t byteAt(size_t offset) const {
            return static_cast<uint8_t>(_data[_pos + offset]);
        }

        std::string_view _data;
        size_t _pos = 0;
    };
}

const char* elevationActionName(ElevationAction action) noexcept {
    switch (action) {
        case ElevationAction::GrantAccess: return "GrantAccess";
        case ElevationAction::EnsureDirectory: return "EnsureDirectory";
    }
    return "Unknown";
}

std::string encodeHeader(const MessageHeader& header) {
    std::string out;
    out.reserve(kElevationHeaderSize);
    putU32(out, header.magic);
    putU16(out, header.version);
    putU16(out, header.type);
    putU32(out, header.length);
    putU32(out, header.reserved);
    return out;
}

std::optional<MessageHeader> decodeHeader(std::string_view bytes) {
    if (bytes.size() != kElevationHeaderSize) return std::nullopt;
    Reader r(bytes);
    MessageHeader h;
    if (!r.u32(h.magic) || !r.u16(h.version) || !r.u16(h.type) || !r.u32(h.length) || !r.u32(h.reserved)) {
        return std::nullopt;
    }
    if (h.magic != kElevationMagic || h.version != kElevationProtocolVersion) return std::nullopt;
    if (h.length > kElevationMaxPayload) return std::nullopt;
    return h;
}

std::string encodeRequest(const ElevationRequest& request) {
    std::string out;
    putU8(out, static_cast<uint8_t>(request.action));
    putU32(out, request.userId);
    putString(out, request.sessionId);
    putString(out, request.path);
    return out;
}

std::optional<ElevationRequest> decodeRequest(std::string_view payload) {
    Reader r(payload);
    ElevationRequest req;
    uint8_t action = 0;
    if (!r.u8(action) || !r.u32(req.userId) || !r.str(req.sessionId) || !r.str(req.path) || !r.atEnd()) {
        return std::nullopt;
    }
    if (action != static_cast<uint8_t>(ElevationAction::GrantAccess) &&
        action != static_cast<uint8_t>(ElevationAction::EnsureDirectory)) {
        return std::nullopt;
    }
    if (req.path.empty()) return std::nullopt;
    req.action = static_cast<ElevationAction>(action);
    return req;
}

std::string encodeResponse(const ElevationResponse& response) {
    std::string out;
    putU8(out, response.success ? 1 : 0);
    putU32(out, static_cast<uint32_t>(response.errorNumber));
    putString(out, response.message);
    return out;
}

std::optional<ElevationResponse> decodeResponse(std::string_view payload) {
    Reader r(payload);
    ElevationResponse resp;
    uint8_t success = 0;
    uint32_t err = 0;
    if (!r.u8(success) || !r.u32(err) || !r.str(resp.message) || !r.atEnd()) {
        return std::nullopt;
    }
    resp.success = success != 0;
    resp.errorNumber = static_cast<int32_t>(err);
    return resp;
}

} // namespace Steadfast::Core::IO
