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

#include <map>
#include <set>
#include <mutex>
#include <memory>
#include <string>
#include <vector>

#include "gwbridge/Session.h"
#include "gwbridge/SessionConfig.h"

namespace kc1fsz {

class Log;

    namespace gwbridge {

class SessionPool;

struct CallRecord {
    std::string callId;
    std::string gatewayId;
    std::string callerNumber;
    std::shared_ptr<Session> session;
    // Wall-clock seconds since the epoch
    uint64_t startedAt = 0;
};

/**
 * Tracks which upstream session belongs to which gateway call. A call id
 * maps to at most one session at a time.
 *
 * All methods are thread-safe.
 */
class CallManager {
public:

    CallManager(Log& log, SessionPool& pool, unsigned acquireTimeoutMs);

    /**
     * Acquires a session from the pool and records the mapping.
     *
     * @param cfg Optional.
     * @throws DuplicateCallError if the call already has a session (or one
     * is in the middle of being acquired).
     * @throws Anything SessionPool::acquire() throws.
     */
    CallRecord createSession(const std::string& callId, const std::string& gatewayId,
        const std::string& callerNumber, const SessionConfig* cfg = nullptr);

    /**
     * @returns null if the call is unknown.
     */
    std::shared_ptr<Session> getSession(const std::string& callId);

    /**
     * @returns false if the call is unknown.
     */
    bool getRecord(const std::string& callId, CallRecord& out);

    /**
     * Removes the mapping and releases the session back to the pool.
     * Unknown or already-ended calls are logged and ignored. Never throws.
     */
    void endSession(const std::string& callId);

    /**
     * Ends every active call. Used on shutdown.
     */
    void teardownAll();

    unsigned activeCallCount();

    std::vector<std::string> activeCallIds();

private:

    Log& _log;
    SessionPool& _pool;
    const unsigned _acquireTimeoutMs;

    std::mutex _lock;
    std::map<std::string, CallRecord> _calls;
    // Calls that are waiting on the pool
    std::set<std::string> _pending;
};

    }
}
