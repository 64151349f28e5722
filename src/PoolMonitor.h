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

#include "Runnable2.h"

namespace kc1fsz {

class Log;

    namespace gwbridge {

class SessionPool;
class CallManager;

/**
 * Logs pool and call statistics periodically.
 */
class PoolMonitor : public Runnable2 {
public:

    PoolMonitor(Log& log, SessionPool& pool, CallManager& calls);

    void tenSecTick();

private:

    Log& _log;
    SessionPool& _pool;
    CallManager& _calls;
    unsigned _lastActive = 0;
    unsigned _peakActive = 0;
};

    }
}
