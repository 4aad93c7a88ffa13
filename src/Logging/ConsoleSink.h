/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Steadfast Core project.
 */

#pragma once

#include <iosfwd>
#include <mutex>
#include "ILogSink.h"

namespace Steadfast {
namespace Core {
namespace Logging {

    /**
     * @brief Writes entries to the console
     *
     * Warnings and above go to the error stream, everything else to the output
     * stream. Both streams can be replaced for capture in tests.
     */
    class ConsoleSink : public ILogSink {
    public:
        ConsoleSink();
        ConsoleSink(std::ostream& out, std::ostream& err);

        void write(const LogEntry& entry) override;
        void flush() override;

        static std::string format(const LogEntry& entry);

    private:
        std::ostream* _out;
        std::ostream* _err;
        std::mutex _mutex;
    };

} // namespace Logging
} // namespace Core
} // namespace Steadfast
