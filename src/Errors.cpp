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
#include "gwbridge/Errors.h"

using namespace std;

namespace kc1fsz {
    namespace gwbridge {

AdmissionExhausted::AdmissionExhausted(unsigned maxSessions)
:   BridgeError("Connection pool exhausted: " + to_string(maxSessions) +
        " concurrent sessions at capacity"),
    _maxSessions(maxSessions) {
}

SessionLifecycleError::SessionLifecycleError(const string& sessionId, const string& msg)
:   BridgeError("[session:" + sessionId + "] " + msg),
    _sessionId(sessionId) {
}

DuplicateCallError::DuplicateCallError(const string& callId)
:   BridgeError("Call " + callId + " already has an active session") {
}

    }
}
