/**
 * Copyright (C) 2025, Bruce MacKinnon KC1FSZ
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */
#pragma once

#include <functional>

namespace kc1fsz {

class Log;
class Clock;
class Runnable2;

class EventLoop {
public:

    /**
     * Runs the tasks until the callback asks to stop.
     *
     * @param cb (Optional) Called on every cycle. If false is
     * returned then the loop exits.
     * @param maxSleepMs The longest the loop will block when nothing
     * is happening. This bounds how long a stop request can go unnoticed.
     */
    static void run(Log& log, Clock& clock,
        Runnable2** tasks, unsigned tasksLen,
        std::function<bool(Log& log, Clock& clock)> cb = nullptr,
        unsigned maxSleepMs = 100,
        bool trace = false);
};

}
