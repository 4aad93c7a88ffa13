/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Steadfast Core project.
 */

#pragma once

/**
 * @file CoreCommon.h
 * @brief Core common utilities and debugging macros for SteadfastCore
 *
 * Debug assertions, build configuration flags and the environment lookup used by
 * the configuration layer.
 */

#include <cassert>
#include <optional>
#include <string>
#include <cstdlib>

#ifdef SteadfastDebug
#define STEADFAST_DEBUG_BLOCK(code) do { code } while(0)
#undef NDEBUG
#define STEADFAST_ASSERT(condition, message) assert(condition)
#else
#define STEADFAST_DEBUG_BLOCK(code) ((void)0)
#define STEADFAST_ASSERT(condition, message) ((void)0)
#endif

namespace Steadfast {
namespace Core {
    // Copies the variable into a std::string. Returns std::nullopt if it is not set.
    inline std::optional<std::string> safeGetEnv(const char* name) {
        if (!name) return std::nullopt;
        const char* v = std::getenv(name);
        if (!v) return std::nullopt;
        return std::string(v);
    }
} // namespace Core
}
