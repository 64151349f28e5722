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
#include <vector>

#include "kc1fsz-tools/Log.h"
#include "kc1fsz-tools/Clock.h"

#include "gwbridge/Errors.h"
#include "gwbridge/SessionConfig.h"

#include "CallManager.h"
#include "InboundRouter.h"
#include "ToolExecutor.h"
#include "GatewayConnection.h"

using namespace std;

namespace kc1fsz {
    namespace gwbridge {

// Upper bound on upstream responses handled per service() so that device
// frames never wait long
static const unsigned MAX_RESPONSES_PER_SERVICE = 32;

GatewayConnection::GatewayConnection(Log& log, Clock& clock, const string& connectionId,
    GatewayLink& link, CallManager& calls, InboundRouter* router,
    ToolExecutor* tools, const BridgeSettings& settings)
:   _log(log),
    _clock(clock),
    _id(connectionId),
    _link(link),
    _calls(calls),
    _router(router),
    _tools(tools),
    _settings(settings),
    _pendingPolicy(settings.pendingDecisionTtlMs),
    _pendingDecisions(clock, &_pendingPolicy),
    _toUpstream(settings.gatewayRate, settings.upstreamInputRate),
    _toGateway(settings.upstreamOutputRate, settings.gatewayRate),
    _finished(false) {
    _log.info("Gateway connection %s opened", _id.c_str());
}

GatewayConnection::~GatewayConnection() {
    // Make sure that nothing is leaked if we are destroyed early
    if (!_finished.load())
        _cleanup();
}

void GatewayConnection::onText(const string& text) {
    DeviceFrame f;
    f.type = DeviceFrame::Type::TEXT;
    f.data = text;
    _inbox.push(f);
}

void GatewayConnection::onBinary(const string& data) {
    DeviceFrame f;
    f.type = DeviceFrame::Type::BINARY;
    f.data = data;
    _inbox.push(f);
}

void GatewayConnection::onClosed() {
    DeviceFrame f;
    f.type = DeviceFrame::Type::CLOSED;
    _inbox.push(f);
}

bool GatewayConnection::service(unsigned waitMs) {

    if (_finished.load())
        return false;

    bool didWork = false;

    // Everything the device has already sent, in order of receipt
    DeviceFrame f;
    while (!_closed && _inbox.try_pop(f, 0)) {
        _handle(f);
        didWork = true;
    }

    if (_closed)
        return didWork;

    if (_session) {
        if (_relayUpstream(didWork ? 0 : waitMs))
            didWork = true;
    } else if (!didWork && waitMs > 0) {
        if (_inbox.try_pop(f, waitMs)) {
            _handle(f);
            didWork = true;
        }
    }

    return didWork;
}

void GatewayConnection::_handle(const DeviceFrame& frame) {
    switch (frame.type) {
        case DeviceFrame::Type::TEXT:
            _handleText(frame.data);
            break;
        case DeviceFrame::Type::BINARY:
            _handleAudio(frame.data);
            break;
        case DeviceFrame::Type::CLOSED:
            _log.info("Gateway connection %s closed", _id.c_str());
            _cleanup();
            break;
    }
}

void GatewayConnection::_send(const string& frame) {
    if (!_link.sendText(frame))
        _log.error("Gateway connection %s send failed", _id.c_str());
}

void GatewayConnection::_handleText(const string& text) {

    InboundFrame frame;
    string err;
    if (!parseInboundFrame(text, frame, err)) {
        _log.error("Gateway connection %s ignored frame: %s", _id.c_str(), err.c_str());
        return;
    }

    switch (frame.type) {
        case InboundType::INCOMING_CALL:
            _onIncomingCall(frame);
            break;
        case InboundType::CALL_CONNECTED:
            _onCallConnected(frame);
            break;
        case InboundType::CALL_ENDED:
            _onCallEnded(frame);
            break;
    }
}

void GatewayConnection::_onIncomingCall(const InboundFrame& frame) {

    const IncomingCall& call = frame.incoming;

    _log.info("Incoming call %s from %s to %s (gateway=%s, carrier=%s, sim=%d)",
        call.callId.c_str(), call.fromNumber.c_str(), call.toNumber.c_str(),
        call.gatewayId.c_str(), call.carrier.c_str(), call.simSlot);

    RoutingDecision d;
    d.callId = call.callId;
    if (_router) {
        // route() never throws
        d = _router->route(call);
        _router->logInteraction(call, d);
    }

    switch (d.action) {
        case RoutingAction::ANSWER:
            _pendingDecisions.put(call.callId, d);
            _send(makeAnswerCall(call.callId));
            break;
        case RoutingAction::REJECT:
            _send(makeRejectCall(call.callId, d.rejectReason));
            break;
        case RoutingAction::FORWARD:
            if (d.forwardTo.empty()) {
                _log.error("Call %s forward rule %s has no target, answering", call.callId.c_str(),
                    d.ruleName.c_str());
                d.action = RoutingAction::ANSWER;
                _pendingDecisions.put(call.callId, d);
                _send(makeAnswerCall(call.callId));
            } else {
                _send(makeForwardCall(call.callId, d.forwardTo));
            }
            break;
    }
}

void GatewayConnection::_onCallConnected(const InboundFrame& frame) {

    if (!_callId.empty()) {
        _log.info("Call %s replaces active call %s", frame.callId.c_str(), _callId.c_str());
        _endCall("replaced", string());
    }

    SessionConfig cfg;
    RoutingDecision d;
    if (_pendingDecisions.take(frame.callId, d)) {
        cfg.systemInstruction = d.systemInstruction;
        cfg.voiceName = d.voiceName;
    }

    try {
        CallRecord rec = _calls.createSession(frame.callId, frame.gatewayId,
            frame.callerNumber, &cfg);
        _callId = frame.callId;
        _session = rec.session;
        _inputTranscript.clear();
        _outputTranscript.clear();
    }
    catch (const exception& ex) {
        _log.error("Call %s could not get a session: %s", frame.callId.c_str(), ex.what());
        _send(makeSessionError(frame.callId, ex.what()));
        return;
    }

    _send(makeSessionReady(_callId, _session->id()));
}

void GatewayConnection::_onCallEnded(const InboundFrame& frame) {

    _log.info("Call %s ended by gateway (%s)", frame.callId.c_str(), frame.reason.c_str());

    _pendingDecisions.remove(frame.callId);

    if (frame.callId == _callId)
        _endCall("ended by gateway", string());
    else
        // Not ours (any more), but make sure that nothing is left behind
        _calls.endSession(frame.callId);
}

void GatewayConnection::_handleAudio(const string& data) {

    if (!_session) {
        _discardedFrames++;
        return;
    }

    const uint8_t* p = (const uint8_t*)data.data();
    unsigned len = data.size();

    try {
        if (len % 2 != 0)
            throw MalformedAudioError("PCM16 frame has odd length " + to_string(len));
        if (_settings.gatewayRate == _settings.upstreamInputRate) {
            _session->sendAudio(p, len);
        } else {
            vector<uint8_t> pcm;
            _toUpstream.resample(p, len, pcm);
            _session->sendAudio(pcm.data(), pcm.size());
        }
    }
    catch (const MalformedAudioError& ex) {
        _rejectedFrames++;
        _log.error("Call %s audio frame rejected: %s", _callId.c_str(), ex.what());
    }
    catch (const SessionLifecycleError& ex) {
        _endCall("session failure", ex.what());
    }
}

bool GatewayConnection::_relayUpstream(unsigned waitMs) {

    bool didWork = false;

    try {
        AgentResponse r;
        for (unsigned i = 0; _session && i < MAX_RESPONSES_PER_SERVICE; i++) {
            if (!_session->receive(r, i == 0 ? waitMs : 0))
                break;
            _relayResponse(r);
            r = AgentResponse();
            didWork = true;
        }
    }
    catch (const SessionLifecycleError& ex) {
        _endCall("session failure", ex.what());
        didWork = true;
    }

    return didWork;
}

void GatewayConnection::_relayResponse(const AgentResponse& r) {

    if (r.hasToolCalls())
        _handleToolCalls(r.toolCalls);

    if (r.hasAudio()) {
        const unsigned rate = r.audioRate ? r.audioRate : _settings.upstreamOutputRate;
        if (rate == _settings.gatewayRate) {
            _link.sendBinary(r.audio.data(), r.audio.size());
        } else {
            try {
                _toGateway.setRates(rate, _settings.gatewayRate);
                vector<uint8_t> pcm;
                _toGateway.resample(r.audio.data(), r.audio.size(), pcm);
                if (!pcm.empty())
                    _link.sendBinary(pcm.data(), pcm.size());
            }
            catch (const MalformedAudioError& ex) {
                _log.error("Call %s upstream audio dropped: %s", _callId.c_str(), ex.what());
            }
        }
    }

    if (!r.inputTranscript.empty()) {
        _inputTranscript += r.inputTranscript;
        _send(makeCallTranscript(_callId, "caller", r.inputTranscript));
    }
    if (!r.outputTranscript.empty()) {
        _outputTranscript += r.outputTranscript;
        _send(makeCallTranscript(_callId, "agent", r.outputTranscript));
    }

    // A response can carry both, each is reported as its own turn
    if (r.turnComplete)
        _endTurn(false);
    if (r.interrupted)
        _endTurn(true);
}

void GatewayConnection::_endTurn(bool wasInterrupted) {
    _send(makeTurnComplete(_callId, _outputTranscript, _inputTranscript, wasInterrupted));
    _inputTranscript.clear();
    _outputTranscript.clear();
}

void GatewayConnection::_handleToolCalls(const vector<ToolCall>& calls) {

    vector<ToolResult> results;

    for (const ToolCall& call : calls) {
        _send(makeToolExecution(_callId, call.name, call.id, "executing"));
        ToolResult r;
        if (_tools) {
            r = _tools->execute(call);
        } else {
            r.id = call.id;
            r.name = call.name;
            r.result = nlohmann::json({ { "error", "Tool execution is not available" } });
        }
        _send(makeToolExecution(_callId, call.name, call.id, "completed"));
        results.push_back(r);
    }

    // Failure here is picked up by the next receive()
    try {
        _session->sendToolResponse(results);
    }
    catch (const SessionLifecycleError& ex) {
        _log.error("Call %s tool response not sent: %s", _callId.c_str(), ex.what());
    }
}

void GatewayConnection::_endCall(const string& why, const string& error) {

    if (_callId.empty())
        return;

    // Cleared first so that no other path can end it again
    const string callId = _callId;
    _callId.clear();
    _session.reset();
    _inputTranscript.clear();
    _outputTranscript.clear();

    _log.info("Call %s ending: %s", callId.c_str(), why.c_str());

    if (!error.empty())
        _send(makeSessionError(callId, error));

    // Idempotent and never throws
    _calls.endSession(callId);
}

void GatewayConnection::_cleanup() {
    _closed = true;
    _endCall("connection closed", string());
    _pendingDecisions.clear();
    _finished = true;
}

    }
}
