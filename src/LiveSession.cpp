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
#include <ctime>

#include "kc1fsz-tools/Log.h"

#include "gwbridge/Errors.h"

#include "LiveSession.h"

using namespace std;

namespace kc1fsz {
    namespace gwbridge {

const char* sessionStateName(SessionState s) {
    switch (s) {
        case SessionState::CONNECTING: return "connecting";
        case SessionState::ACTIVE: return "active";
        case SessionState::EXTENDING: return "extending";
        case SessionState::CLOSING: return "closing";
        case SessionState::CLOSED: return "closed";
        case SessionState::ERROR: return "error";
    }
    return "";
}

static uint64_t wallSec() {
    return (uint64_t)std::time(nullptr);
}

LiveSession::LiveSession(Log& log, const SessionConfig& cfg, TransportFactory factory,
    unsigned extendBufferSec)
:   _log(log),
    _config(cfg),
    _factory(factory),
    _extendBufferSec(extendBufferSec),
    _extensionTimer("ext-" + cfg.sessionId.substr(0, 8)) {
    if (_config.sessionId.empty())
        throw ConfigurationError("Session id is required");
    _createdAt = wallSec();
    _lastActivityAt = _createdAt;
}

LiveSession::~LiveSession() {
    teardown();
}

unsigned LiveSession::extensionDelayMs() const {
    unsigned delaySec = _config.timeoutSec;
    if (_config.timeoutSec > _extendBufferSec)
        delaySec = _config.timeoutSec - _extendBufferSec;
    return delaySec * 1000;
}

SessionState LiveSession::state() const {
    lock_guard<mutex> guard(_lock);
    return _state;
}

SessionInfo LiveSession::info() const {
    lock_guard<mutex> guard(_lock);
    SessionInfo i;
    i.id = _config.sessionId;
    i.state = _state;
    i.modelId = _config.modelId;
    i.voiceName = _config.voiceName;
    i.outputMode = outputModeName(_config.outputMode);
    i.createdAt = _createdAt;
    i.lastActivityAt = _lastActivityAt;
    i.hasResumptionToken = _transport && !_transport->resumptionToken().empty();
    i.metrics = _metrics;
    return i;
}

void LiveSession::start() {

    {
        lock_guard<mutex> guard(_lock);
        if (_state == SessionState::ACTIVE || _state == SessionState::EXTENDING)
            throw SessionLifecycleError(id(), "Session is already active");
        if (_state != SessionState::CONNECTING)
            throw SessionLifecycleError(id(), string("Session cannot be started from state ") +
                sessionStateName(_state));
    }

    _log.info("Starting session %s (model=%s, voice=%s, mode=%s)", id().c_str(),
        _config.modelId.c_str(), _config.voiceName.c_str(),
        outputModeName(_config.outputMode));

    shared_ptr<StreamingTransport> t;
    try {
        _config.validate();
        t = _factory(_config);
        t->connect("");
    }
    catch (const ConfigurationError&) {
        lock_guard<mutex> guard(_lock);
        _state = SessionState::ERROR;
        throw;
    }
    catch (const exception& ex) {
        _log.error("Session %s failed to start: %s", id().c_str(), ex.what());
        lock_guard<mutex> guard(_lock);
        _state = SessionState::ERROR;
        throw SessionLifecycleError(id(), string("Failed to start session: ") + ex.what());
    }

    {
        lock_guard<mutex> guard(_lock);
        // A teardown could have happened while we were connecting
        if (_state != SessionState::CONNECTING) {
            t->close();
            throw SessionLifecycleError(id(), "Session was closed during start");
        }
        _transport = t;
        _state = SessionState::ACTIVE;
        _touch();
        // Armed under the lock so that a teardown always sees it
        _scheduleExtension();
    }

    _log.info("Session %s active", id().c_str());
}

void LiveSession::_ensureActive() const {
    if (_state == SessionState::ACTIVE || _state == SessionState::EXTENDING)
        return;
    if (_state == SessionState::ERROR && _extensionFailed)
        throw SessionTimeoutError(id(), "Session expired, extension failed");
    throw SessionLifecycleError(id(), string("Session is not active (state=") +
        sessionStateName(_state) + ")");
}

void LiveSession::_touch() {
    _lastActivityAt = wallSec();
}

void LiveSession::_deliver(StreamingTransport& t, const PendingSend& item) {
    switch (item.type) {
        case PendingSend::Type::AUDIO:
            t.sendAudio(item.audio.data(), item.audio.size());
            break;
        case PendingSend::Type::AUDIO_END:
            t.sendAudioEnd();
            break;
        case PendingSend::Type::TEXT:
            t.sendText(item.text);
            break;
        case PendingSend::Type::TOOL_RESPONSE:
            t.sendToolResponse(item.results);
            break;
    }
}

void LiveSession::_send(PendingSend&& item) {
    _ensureActive();
    if (_state == SessionState::EXTENDING) {
        _pendingSends.push_back(std::move(item));
    } else {
        try {
            _deliver(*_transport, item);
        }
        catch (const TransportError& ex) {
            _state = SessionState::ERROR;
            throw SessionLifecycleError(id(), ex.what());
        }
    }
    _touch();
}

void LiveSession::sendAudio(const uint8_t* data, unsigned len) {
    lock_guard<mutex> guard(_lock);
    PendingSend item;
    item.type = PendingSend::Type::AUDIO;
    item.audio.assign(data, data + len);
    _send(std::move(item));
    _metrics.chunksSent++;
    _metrics.bytesSent += len;
}

void LiveSession::sendAudioEnd() {
    lock_guard<mutex> guard(_lock);
    PendingSend item;
    item.type = PendingSend::Type::AUDIO_END;
    _send(std::move(item));
}

void LiveSession::sendText(const string& text) {
    lock_guard<mutex> guard(_lock);
    PendingSend item;
    item.type = PendingSend::Type::TEXT;
    item.text = text;
    _send(std::move(item));
}

void LiveSession::sendToolResponse(const vector<ToolResult>& results) {
    lock_guard<mutex> guard(_lock);
    PendingSend item;
    item.type = PendingSend::Type::TOOL_RESPONSE;
    item.results = results;
    _send(std::move(item));
}

void LiveSession::_countReceived(const AgentResponse& r) {
    if (r.hasAudio()) {
        _metrics.chunksReceived++;
        _metrics.bytesReceived += r.audio.size();
    }
    _touch();
}

bool LiveSession::receive(AgentResponse& out, unsigned timeoutMs) {

    shared_ptr<StreamingTransport> t;
    {
        lock_guard<mutex> guard(_lock);
        _ensureActive();
        if (!_carryOver.empty()) {
            out = std::move(_carryOver.front());
            _carryOver.pop_front();
            _countReceived(out);
            return true;
        }
        t = _transport;
    }

    // The wait happens without the lock so that sends and extension can
    // proceed
    bool got = t->receive(out, timeoutMs);

    lock_guard<mutex> guard(_lock);
    if (got) {
        _countReceived(out);
        return true;
    }
    // Did the upstream hang up on us?
    if (!t->isOpen() && t == _transport && _state == SessionState::ACTIVE) {
        _log.error("Session %s upstream connection closed", id().c_str());
        _state = SessionState::ERROR;
        throw SessionLifecycleError(id(), "Upstream connection closed");
    }
    return false;
}

void LiveSession::extend() {

    shared_ptr<StreamingTransport> old;
    string token;
    {
        lock_guard<mutex> guard(_lock);
        if (_state != SessionState::ACTIVE)
            throw SessionLifecycleError(id(), string("Cannot extend session in state ") +
                sessionStateName(_state));
        token = _transport->resumptionToken();
        if (token.empty())
            throw SessionLifecycleError(id(), "No resumption handle available for extension");
        _state = SessionState::EXTENDING;
        old = _transport;
    }

    _log.info("Extending session %s", id().c_str());

    shared_ptr<StreamingTransport> fresh;
    try {
        fresh = _factory(_config);
        fresh->connect(token);
    }
    catch (const exception& ex) {
        _log.error("Session %s extension failed: %s", id().c_str(), ex.what());
        {
            lock_guard<mutex> guard(_lock);
            if (_state == SessionState::EXTENDING) {
                _state = SessionState::ERROR;
                _extensionFailed = true;
            }
            _pendingSends.clear();
        }
        old->close();
        throw SessionTimeoutError(id(), string("Session extension failed: ") + ex.what());
    }

    {
        lock_guard<mutex> guard(_lock);

        if (_state != SessionState::EXTENDING) {
            // Torn down while we were connecting
            fresh->close();
            return;
        }

        // Nothing more will arrive on the old connection after this, so
        // anything it is holding goes ahead of the new connection's traffic
        old->close();
        AgentResponse r;
        while (old->receive(r, 0)) {
            _carryOver.push_back(std::move(r));
            r = AgentResponse();
        }

        _transport = fresh;

        try {
            while (!_pendingSends.empty()) {
                _deliver(*_transport, _pendingSends.front());
                _pendingSends.pop_front();
            }
        }
        catch (const TransportError& ex) {
            _state = SessionState::ERROR;
            _extensionFailed = true;
            _pendingSends.clear();
            throw SessionTimeoutError(id(), string("Session extension failed: ") + ex.what());
        }

        _state = SessionState::ACTIVE;
        _metrics.extensions++;
        _touch();
        _scheduleExtension();
    }

    _log.info("Session %s extended", id().c_str());
}

bool LiveSession::isExtensionScheduled() {
    return _extensionTimer.isPending();
}

void LiveSession::_scheduleExtension() {
    _extensionTimer.schedule(extensionDelayMs(), [this]() { _extensionTimerFired(); });
}

void LiveSession::_extensionTimerFired() {
    try {
        extend();
    }
    catch (const SessionTimeoutError&) {
        // State has already been moved to ERROR
    }
    catch (const SessionLifecycleError& ex) {
        lock_guard<mutex> guard(_lock);
        // Only a live session is marked, a teardown may have raced us
        if (_state == SessionState::ACTIVE) {
            _log.error("Session %s cannot be extended: %s", id().c_str(), ex.what());
            _state = SessionState::ERROR;
            _extensionFailed = true;
        }
    }
}

void LiveSession::teardown() {

    shared_ptr<StreamingTransport> t;
    {
        lock_guard<mutex> guard(_lock);
        if (_state == SessionState::CLOSED || _state == SessionState::CLOSING)
            return;
        _state = SessionState::CLOSING;
        t = _transport;
    }

    _extensionTimer.cancel();

    if (t) {
        try {
            t->close();
        }
        catch (const exception& ex) {
            _log.error("Session %s error while closing: %s", id().c_str(), ex.what());
        }
    }

    SessionMetrics m;
    {
        lock_guard<mutex> guard(_lock);
        _state = SessionState::CLOSED;
        _pendingSends.clear();
        _carryOver.clear();
        m = _metrics;
    }

    _log.info("Session %s closed (sent %llu chunks/%llu bytes, received %llu chunks/%llu bytes, %u extensions)",
        id().c_str(),
        (unsigned long long)m.chunksSent, (unsigned long long)m.bytesSent,
        (unsigned long long)m.chunksReceived, (unsigned long long)m.bytesReceived,
        m.extensions);
}

    }
}
