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

#include <atomic>
#include <memory>
#include <string>

#include "kc1fsz-tools/threadsafequeue2.h"

#include "gwbridge/GatewayLink.h"
#include "gwbridge/KeyValueStore.h"
#include "gwbridge/Resampler.h"
#include "gwbridge/Routing.h"
#include "gwbridge/Session.h"

#include "Runnable2.h"
#include "GatewayProtocol.h"

namespace kc1fsz {

class Log;
class Clock;

    namespace gwbridge {

class CallManager;
class InboundRouter;
class ToolExecutor;

struct BridgeSettings {
    // Audio to and from the gateway device
    unsigned gatewayRate = 16000;
    // What the upstream expects to receive
    unsigned upstreamInputRate = 16000;
    // What the upstream sends unless a response says otherwise
    unsigned upstreamOutputRate = 24000;
    // How long an answer decision waits for CALL_CONNECTED
    uint32_t pendingDecisionTtlMs = 60000;
};

/**
 * The protocol handler for one connected gateway device. It answers,
 * relays and ends calls, at most one call at a time.
 *
 * Frames from the device are queued by the socket thread (onText(),
 * onBinary(), onClosed()) and handled in order of receipt by whatever
 * thread calls service(). The same thread drains the upstream session
 * so device audio and upstream responses are interleaved without any
 * locking here.
 *
 * However a call ends (CALL_ENDED, socket closed, upstream failure) the
 * session is released exactly once.
 */
class GatewayConnection : public Runnable2 {
public:

    /**
     * @param router Optional. Without it every call is answered.
     * @param tools Optional. Without it every tool call gets an error result.
     */
    GatewayConnection(Log& log, Clock& clock, const std::string& connectionId,
        GatewayLink& link, CallManager& calls, InboundRouter* router,
        ToolExecutor* tools, const BridgeSettings& settings);
    virtual ~GatewayConnection();

    // ----- Called from the socket thread -------------------------------------

    void onText(const std::string& text);
    void onBinary(const std::string& data);
    void onClosed();

    // ----- Called from the service thread ------------------------------------

    /**
     * Handles everything that is ready, waiting up to waitMs if nothing is.
     *
     * @returns true if anything was done.
     */
    bool service(unsigned waitMs);

    /**
     * @returns true once the socket has closed and everything has been
     * cleaned up.
     */
    bool isFinished() const { return _finished.load(); }

    const std::string& id() const { return _id; }

    /**
     * @returns The call that is currently up, or empty.
     */
    std::string activeCallId() const { return _callId; }

    unsigned discardedAudioFrames() const { return _discardedFrames; }
    unsigned rejectedAudioFrames() const { return _rejectedFrames; }

    // ----- Runnable2 ---------------------------------------------------------

    bool run2() { return service(0); }

private:

    struct DeviceFrame {
        enum class Type { TEXT, BINARY, CLOSED };
        Type type = Type::TEXT;
        std::string data;
    };

    void _handle(const DeviceFrame& frame);
    void _handleText(const std::string& text);
    void _handleAudio(const std::string& data);

    void _onIncomingCall(const InboundFrame& frame);
    void _onCallConnected(const InboundFrame& frame);
    void _onCallEnded(const InboundFrame& frame);

    bool _relayUpstream(unsigned waitMs);
    void _relayResponse(const AgentResponse& r);
    void _endTurn(bool wasInterrupted);
    void _handleToolCalls(const std::vector<ToolCall>& calls);

    /**
     * Releases the active call, if any.
     *
     * @param error If not empty, a SESSION_ERROR is sent to the device.
     */
    void _endCall(const std::string& why, const std::string& error);
    void _cleanup();
    void _send(const std::string& frame);

    Log& _log;
    Clock& _clock;
    const std::string _id;
    GatewayLink& _link;
    CallManager& _calls;
    InboundRouter* _router;
    ToolExecutor* _tools;
    const BridgeSettings _settings;

    threadsafequeue2<DeviceFrame> _inbox;

    // Answer decisions waiting for CALL_CONNECTED
    TtlEviction<std::string> _pendingPolicy;
    KeyValueStore<std::string, RoutingDecision> _pendingDecisions;

    Resampler _toUpstream;
    Resampler _toGateway;

    std::string _callId;
    std::shared_ptr<Session> _session;
    std::string _inputTranscript;
    std::string _outputTranscript;

    bool _closed = false;
    std::atomic<bool> _finished;
    unsigned _discardedFrames = 0;
    unsigned _rejectedFrames = 0;
};

    }
}
