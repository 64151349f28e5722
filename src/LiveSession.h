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

#include <deque>
#include <mutex>
#include <memory>

#include "gwbridge/Session.h"
#include "gwbridge/SessionConfig.h"
#include "gwbridge/StreamingTransport.h"

#include "OneShotTimer.h"

namespace kc1fsz {

class Log;

    namespace gwbridge {

/**
 * A session that talks directly to one upstream streaming transport.
 *
 * The upstream enforces a hard limit on the length of a connection, so
 * a timer fires a little before the limit and moves the conversation
 * onto a fresh transport using the resumption token. Anything sent while
 * the hop is in progress is queued and delivered to the new transport
 * in order. Responses still waiting on the old transport are delivered
 * before anything from the new one.
 */
class LiveSession : public Session {
public:

    static const unsigned DEFAULT_EXTEND_BUFFER_SEC = 60;

    /**
     * @param cfg Should already have the pool defaults merged in.
     * @param factory Used for the initial connect and for every extension.
     * @param extendBufferSec How long before the timeout the extension
     * should happen.
     */
    LiveSession(Log& log, const SessionConfig& cfg, TransportFactory factory,
        unsigned extendBufferSec = DEFAULT_EXTEND_BUFFER_SEC);
    virtual ~LiveSession();

    const SessionConfig& config() const { return _config; }

    /**
     * @returns How long after (re)connect the extension will fire.
     */
    unsigned extensionDelayMs() const;

    /**
     * @returns true while the extension timer is armed.
     */
    bool isExtensionScheduled();

    // ----- Session ----------------------------------------------------------

    const std::string& id() const { return _config.sessionId; }
    SessionState state() const;
    SessionInfo info() const;
    void start();
    void sendAudio(const uint8_t* data, unsigned len);
    void sendAudioEnd();
    void sendText(const std::string& text);
    void sendToolResponse(const std::vector<ToolResult>& results);
    bool receive(AgentResponse& out, unsigned timeoutMs);
    void extend();
    void teardown();

private:

    /**
     * Something sent while the transport was being swapped.
     */
    struct PendingSend {
        enum class Type { AUDIO, AUDIO_END, TEXT, TOOL_RESPONSE };
        Type type;
        std::vector<uint8_t> audio;
        std::string text;
        std::vector<ToolResult> results;
    };

    // These are all called with _lock held
    void _ensureActive() const;
    void _touch();
    void _send(PendingSend&& item);
    void _countReceived(const AgentResponse& r);

    static void _deliver(StreamingTransport& t, const PendingSend& item);
    void _scheduleExtension();

    void _extensionTimerFired();

    Log& _log;
    const SessionConfig _config;
    TransportFactory _factory;
    const unsigned _extendBufferSec;

    mutable std::mutex _lock;
    SessionState _state = SessionState::CONNECTING;
    // Tells a timeout-related ERROR apart from any other
    bool _extensionFailed = false;
    std::shared_ptr<StreamingTransport> _transport;
    std::deque<AgentResponse> _carryOver;
    std::deque<PendingSend> _pendingSends;
    SessionMetrics _metrics;
    uint64_t _createdAt = 0;
    uint64_t _lastActivityAt = 0;

    OneShotTimer _extensionTimer;
};

    }
}
