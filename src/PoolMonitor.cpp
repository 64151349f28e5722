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
#include "kc1fsz-tools/Log.h"

#include "gwbridge/Session.h"

#include "SessionPool.h"
#include "CallManager.h"
#include "PoolMonitor.h"

namespace kc1fsz {
    namespace gwbridge {

PoolMonitor::PoolMonitor(Log& log, SessionPool& pool, CallManager& calls)
:   _log(log),
    _pool(pool),
    _calls(calls) {
}

void PoolMonitor::tenSecTick() {

    unsigned active = _pool.activeCount();
    if (active > _peakActive)
        _peakActive = active;

    // Quiet when idle
    if (active == 0 && _lastActive == 0)
        return;
    _lastActive = active;

    unsigned extending = 0, errored = 0;
    for (const SessionInfo& info : _pool.listSessions()) {
        if (info.state == SessionState::EXTENDING)
            extending++;
        else if (info.state == SessionState::ERROR)
            errored++;
    }

    _log.info("Pool: %u/%u sessions (%u free, %u extending, %u error, peak %u), %u calls",
        active, _pool.maxSessions(), _pool.availableSlots(), extending, errored,
        _peakActive, _calls.activeCallCount());
}

    }
}
