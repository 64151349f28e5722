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
#include <chrono>
#include <future>

#include "kc1fsz-tools/Log.h"

#include "gwbridge/Errors.h"

#include "LiveSession.h"
#include "HybridSession.h"
#include "SessionPool.h"

using namespace std;

namespace kc1fsz {
    namespace gwbridge {

SessionFactory makeSessionFactory(Log& log, TransportFactory transports,
    unsigned extendBufferSec, TtsEngine* tts, TtsCache* ttsCache) {
    return [&log, transports, extendBufferSec, tts, ttsCache](const SessionConfig& cfg) {
        auto live = make_shared<LiveSession>(log, cfg, transports, extendBufferSec);
        if (cfg.outputMode == OutputMode::NATIVE_AUDIO)
            return static_pointer_cast<Session>(live);
        if (!tts)
            throw ConfigurationError("Hybrid output requested but no TTS engine is configured");
        return static_pointer_cast<Session>(make_shared<HybridSession>(log, live, cfg,
            *tts, ttsCache));
    };
}

SessionPool::SessionPool(Log& log, SessionFactory factory, unsigned maxSessions,
    const SessionConfig& defaults)
:   _log(log),
    _factory(factory),
    _maxSessions(maxSessions),
    _defaults(defaults) {
    _log.info("Session pool created with capacity %u", _maxSessions);
}

bool SessionPool::_claimSlot(unsigned timeoutMs) {
    unique_lock<mutex> lock(_lock);
    bool ok = _slotReturned.wait_for(lock, chrono::milliseconds(timeoutMs),
        [this]() { return _slotsInUse < _maxSessions; });
    if (ok)
        _slotsInUse++;
    return ok;
}

void SessionPool::_returnSlot() {
    {
        lock_guard<mutex> guard(_lock);
        if (_slotsInUse > 0)
            _slotsInUse--;
    }
    _slotReturned.notify_one();
}

shared_ptr<Session> SessionPool::acquire(const SessionConfig* cfg, unsigned timeoutMs) {

    if (!_claimSlot(timeoutMs)) {
        _log.error("Session pool exhausted (%u in use)", _maxSessions);
        throw AdmissionExhausted(_maxSessions);
    }

    SessionConfig merged = (cfg ? *cfg : SessionConfig()).withDefaults(_defaults);

    shared_ptr<Session> session;
    try {
        session = _factory(merged);
        session->start();
    }
    catch (const exception& ex) {
        _log.error("Session %s could not be acquired: %s", merged.sessionId.c_str(), ex.what());
        if (session)
            session->teardown();
        _returnSlot();
        throw;
    }

    bool duplicate = false;
    unsigned active = 0;
    {
        lock_guard<mutex> guard(_lock);
        if (_sessions.find(session->id()) != _sessions.end())
            duplicate = true;
        else
            _sessions[session->id()] = session;
        active = _sessions.size();
    }

    if (duplicate) {
        session->teardown();
        _returnSlot();
        throw SessionLifecycleError(session->id(), "Session id is already registered");
    }

    _log.info("Session %s acquired (%u/%u active)", session->id().c_str(), active, _maxSessions);
    return session;
}

void SessionPool::release(const string& sessionId) {

    shared_ptr<Session> session;
    {
        lock_guard<mutex> guard(_lock);
        auto it = _sessions.find(sessionId);
        if (it != _sessions.end()) {
            session = it->second;
            _sessions.erase(it);
        }
    }

    if (!session) {
        _log.info("Release of unknown session %s ignored", sessionId.c_str());
        return;
    }

    try {
        session->teardown();
    }
    catch (const exception& ex) {
        _log.error("Session %s teardown failed: %s", sessionId.c_str(), ex.what());
    }

    // Always, regardless of how the teardown went
    _returnSlot();

    _log.info("Session %s released (%u/%u active)", sessionId.c_str(), activeCount(), _maxSessions);
}

void SessionPool::teardownAll() {

    map<string, shared_ptr<Session>> sessions;
    {
        lock_guard<mutex> guard(_lock);
        sessions.swap(_sessions);
    }

    if (sessions.empty())
        return;

    _log.info("Tearing down %u sessions", (unsigned)sessions.size());

    vector<pair<string, future<void>>> work;
    for (auto& [id, session] : sessions) {
        shared_ptr<Session> s = session;
        work.push_back(make_pair(id, async(launch::async, [s]() { s->teardown(); })));
    }

    unsigned failures = 0;
    for (auto& [id, f] : work) {
        try {
            f.get();
        }
        catch (const exception& ex) {
            failures++;
            _log.error("Session %s teardown failed: %s", id.c_str(), ex.what());
        }
        _returnSlot();
    }

    _log.info("All sessions torn down (%u failures)", failures);
}

shared_ptr<Session> SessionPool::getSession(const string& sessionId) {
    lock_guard<mutex> guard(_lock);
    auto it = _sessions.find(sessionId);
    if (it == _sessions.end())
        return nullptr;
    return it->second;
}

unsigned SessionPool::activeCount() {
    lock_guard<mutex> guard(_lock);
    return _sessions.size();
}

unsigned SessionPool::availableSlots() {
    lock_guard<mutex> guard(_lock);
    return _maxSessions - _slotsInUse;
}

vector<SessionInfo> SessionPool::listSessions() {
    vector<shared_ptr<Session>> sessions;
    {
        lock_guard<mutex> guard(_lock);
        for (const auto& [id, s] : _sessions)
            sessions.push_back(s);
    }
    vector<SessionInfo> result;
    for (const auto& s : sessions)
        result.push_back(s->info());
    return result;
}

    }
}
