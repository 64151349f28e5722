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

#include <stdexcept>
#include <string>

namespace kc1fsz {
    namespace gwbridge {

/**
 * Base for everything the bridge throws on purpose.
 */
class BridgeError : public std::runtime_error {
public:
    explicit BridgeError(const std::string& msg) : std::runtime_error(msg) { }
};

/**
 * No pool capacity became available within the acquire timeout.
 */
class AdmissionExhausted : public BridgeError {
public:
    explicit AdmissionExhausted(unsigned maxSessions);
    unsigned maxSessions() const { return _maxSessions; }
private:
    unsigned _maxSessions;
};

/**
 * An operation is not legal in the session's current state, or the
 * session could not be connected/torn down.
 */
class SessionLifecycleError : public BridgeError {
public:
    SessionLifecycleError(const std::string& sessionId, const std::string& msg);
    const std::string& sessionId() const { return _sessionId; }
private:
    std::string _sessionId;
};

/**
 * The session could not be extended past the upstream duration limit
 * and is no longer usable. The call should be ended.
 */
class SessionTimeoutError : public SessionLifecycleError {
public:
    SessionTimeoutError(const std::string& sessionId, const std::string& msg)
    :   SessionLifecycleError(sessionId, msg) { }
};

/**
 * Raised inside of the router only. It never escapes route().
 */
class RoutingEvaluationError : public BridgeError {
public:
    explicit RoutingEvaluationError(const std::string& msg) : BridgeError("[routing] " + msg) { }
};

/**
 * A PCM16 buffer with an odd number of bytes.
 */
class MalformedAudioError : public BridgeError {
public:
    explicit MalformedAudioError(const std::string& msg) : BridgeError(msg) { }
};

class ConfigurationError : public BridgeError {
public:
    explicit ConfigurationError(const std::string& msg) : BridgeError("[config] " + msg) { }
};

/**
 * Upstream connect/send failure.
 */
class TransportError : public BridgeError {
public:
    explicit TransportError(const std::string& msg) : BridgeError("[upstream] " + msg) { }
};

class TtsError : public BridgeError {
public:
    explicit TtsError(const std::string& msg) : BridgeError("[tts] " + msg) { }
};

/**
 * A call_id that is already mapped to a session.
 */
class DuplicateCallError : public BridgeError {
public:
    explicit DuplicateCallError(const std::string& callId);
};

    }
}
