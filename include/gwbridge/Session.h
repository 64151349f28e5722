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

#include <cstdint>
#include <string>
#include <vector>

#include "gwbridge/StreamingTransport.h"

namespace kc1fsz {
    namespace gwbridge {

enum class SessionState {
    CONNECTING,
    ACTIVE,
    EXTENDING,
    CLOSING,
    CLOSED,
    ERROR
};

const char* sessionStateName(SessionState s);

struct SessionMetrics {
    uint64_t chunksSent = 0;
    uint64_t chunksReceived = 0;
    uint64_t bytesSent = 0;
    uint64_t bytesReceived = 0;
    unsigned extensions = 0;
};

/**
 * A point-in-time snapshot of a session, used for status reporting.
 */
struct SessionInfo {
    std::string id;
    SessionState state = SessionState::CONNECTING;
    std::string modelId;
    std::string voiceName;
    std::string outputMode;
    // Wall-clock seconds since the epoch
    uint64_t createdAt = 0;
    uint64_t lastActivityAt = 0;
    bool hasResumptionToken = false;
    SessionMetrics metrics;
};

/**
 * The abstract interface for one conversation with the upstream agent.
 *
 * Lifecycle: CONNECTING -> ACTIVE -> (EXTENDING -> ACTIVE)* -> CLOSING
 * -> CLOSED. ERROR can be reached from any in-flight operation.
 *
 * All methods are thread-safe. The I/O methods may be used concurrently
 * with the session's own extension timer.
 */
class Session {
public:

    virtual ~Session() { }

    virtual const std::string& id() const = 0;

    virtual SessionState state() const = 0;

    virtual SessionInfo info() const = 0;

    /**
     * Opens the upstream connection and starts the extension timer.
     *
     * @throws SessionLifecycleError if not in the CONNECTING state, or
     * if the connection fails (state becomes ERROR).
     */
    virtual void start() = 0;

    /**
     * The I/O methods all require the ACTIVE or EXTENDING state.
     *
     * @throws SessionTimeoutError if a previous extension failed.
     * @throws SessionLifecycleError for any other state problem, or if
     * the upstream send fails.
     */
    virtual void sendAudio(const uint8_t* data, unsigned len) = 0;
    virtual void sendAudioEnd() = 0;
    virtual void sendText(const std::string& text) = 0;
    virtual void sendToolResponse(const std::vector<ToolResult>& results) = 0;

    /**
     * Waits up to timeoutMs for the next response event. Call this
     * continuously for as long as the call is up.
     *
     * @returns true if a response was written into out, false if nothing
     * arrived in time.
     * @throws Same as the send methods. Also a SessionLifecycleError if the
     * upstream closed the connection unexpectedly.
     */
    virtual bool receive(AgentResponse& out, unsigned timeoutMs) = 0;

    /**
     * Re-connects using the resumption token so that the conversation
     * carries on past the upstream's session duration limit. Normally
     * called by the session's own timer.
     *
     * @throws SessionLifecycleError if no resumption token is held.
     * @throws SessionTimeoutError if the reconnect fails.
     */
    virtual void extend() = 0;

    /**
     * Idempotent. Safe from any state.
     */
    virtual void teardown() = 0;
};

    }
}
