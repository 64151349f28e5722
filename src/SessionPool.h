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
#include <mutex>
#include <memory>
#include <string>
#include <vector>
#include <functional>
#include <condition_variable>

#include "gwbridge/Session.h"
#include "gwbridge/SessionConfig.h"
#include "gwbridge/StreamingTransport.h"
#include "gwbridge/TtsEngine.h"

#include "HybridSession.h"

namespace kc1fsz {

class Log;

    namespace gwbridge {

/**
 * Makes a new (not yet started) session for a fully-merged config.
 */
typedef std::function<std::shared_ptr<Session>(const SessionConfig& cfg)> SessionFactory;

/**
 * The standard factory: a LiveSession over the transport factory, wrapped
 * in a HybridSession when the config asks for hybrid output.
 *
 * @param tts Optional. Required only for hybrid sessions.
 * @param ttsCache Optional.
 */
SessionFactory makeSessionFactory(Log& log, TransportFactory transports,
    unsigned extendBufferSec, TtsEngine* tts, TtsCache* ttsCache);

/**
 * Admission control for upstream sessions. No more than maxSessions can
 * exist at once. Callers that arrive when the pool is full wait (up to
 * a limit) for a slot to be released.
 *
 * The pool owns every session it hands out. Callers keep a reference for
 * the life of the call and hand it back via release().
 *
 * All methods are thread-safe.
 */
class SessionPool {
public:

    static const unsigned DEFAULT_ACQUIRE_TIMEOUT_MS = 5000;

    /**
     * @param defaults Filled into any empty fields of the configs passed
     * to acquire().
     */
    SessionPool(Log& log, SessionFactory factory, unsigned maxSessions,
        const SessionConfig& defaults);

    /**
     * Waits for a slot, then creates, starts and registers a session.
     *
     * @param cfg Optional.
     * @throws AdmissionExhausted if no slot became free within timeoutMs.
     * @throws SessionLifecycleError (or ConfigurationError) if the session
     * could not be started. The slot is given back first.
     */
    std::shared_ptr<Session> acquire(const SessionConfig* cfg,
        unsigned timeoutMs = DEFAULT_ACQUIRE_TIMEOUT_MS);

    /**
     * Tears down the session and gives its slot back. Unknown or already
     * released ids are ignored. Never throws.
     */
    void release(const std::string& sessionId);

    /**
     * Tears down every registered session in parallel. Used on shutdown.
     */
    void teardownAll();

    /**
     * @returns The session or null if it's not registered.
     */
    std::shared_ptr<Session> getSession(const std::string& sessionId);

    unsigned activeCount();
    unsigned availableSlots();
    unsigned maxSessions() const { return _maxSessions; }
    std::vector<SessionInfo> listSessions();

private:

    bool _claimSlot(unsigned timeoutMs);
    void _returnSlot();

    Log& _log;
    SessionFactory _factory;
    const unsigned _maxSessions;
    const SessionConfig _defaults;

    std::mutex _lock;
    std::condition_variable _slotReturned;
    unsigned _slotsInUse = 0;
    std::map<std::string, std::shared_ptr<Session>> _sessions;
};

    }
}
