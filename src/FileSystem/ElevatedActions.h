/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Steadfast Core project.
 */

/**
 * @file ElevatedActions.h
 * @brief The work the elevated helper performs on behalf of a session
 */
#pragma once
#include "ElevationMessages.h"

namespace Steadfast::Core::IO {

/**
 * @brief Carries out one request with the helper's privileges
 *
 * GrantAccess hands ownership of the path to `grantee` and adds owner read/write (plus
 * execute for directories and already-executable files). When the path does not exist
 * its parent directory is granted instead. EnsureDirectory creates the directory tree
 * first and then grants it. Only regular files and directories are granted; symbolic
 * links are refused.
 *
 * request.userId is what the client claims and is not consulted. The helper passes the
 * uid it verified for the channel's peer.
 */
ElevationResponse executeElevatedRequest(const ElevationRequest& request, uint32_t grantee);

} // namespace Steadfast::Core::IO
