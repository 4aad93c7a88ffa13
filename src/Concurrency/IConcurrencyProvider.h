/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Steadfast Core project.
 */
#pragma once

namespace Steadfast {
namespace Core {
namespace Concurrency {

    class WorkContractGroup;

    /**
     * @brief Receives notifications from groups it executes work for
     *
     * WorkService implements this so worker threads wake as soon as a contract is
     * scheduled and can forget groups that are being destroyed.
     */
    class IConcurrencyProvider {
    public:
        virtual ~IConcurrencyProvider() = default;

        virtual void notifyWorkAvailable(WorkContractGroup* group) = 0;
        virtual void notifyGroupDestroyed(WorkContractGroup* group) = 0;
    };

} // namespace Concurrency
} // namespace Core
} // namespace Steadfast
