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

#include "SessionPool.h"
#include "CallManager.h"

using namespace std;

namespace kc1fsz {
    namespace gwbridge {

CallManager::CallManager(Log& log, SessionPool& pool, unsigned acquireTimeoutMs)
:   _log(log),
    _pool(pool),
    _acquireTimeoutMs(acquireTimeoutMs) {
}

CallRecord CallManager::createSession(const string& callId, const string& gatewayId,
    const string& callerNumber, const SessionConfig* cfg) {

    // Reserve the id first so that two racing creates can't both get
    // through to the pool
    {
        lock_guard<mutex> guard(_lock);
        if (_calls.find(callId) != _calls.end() || _pending.find(callId) != _pending.end())
            throw DuplicateCallError(callId);
        _pending.insert(callId);
    }

    shared_ptr<Session> session;
    try {
        session = _pool.acquire(cfg, _acquireTimeoutMs);
    }
    catch (const exception&) {
        lock_guard<mutex> guard(_lock);
        _pending.erase(callId);
        throw;
    }

    CallRecord rec;
    rec.callId = callId;
    rec.gatewayId = gatewayId;
    rec.callerNumber = callerNumber;
    rec.session = session;
    rec.startedAt = (uint64_t)std::time(nullptr);

    {
        lock_guard<mutex> guard(_lock);
        _pending.erase(callId);
        _calls[callId] = rec;
    }

    _log.info("Call %s mapped to session %s (gateway=%s, caller=%s)", callId.c_str(),
        session->id().c_str(), gatewayId.c_str(), callerNumber.c_str());

    return rec;
}

shared_ptr<Session> CallManager::getSession(const string& callId) {
    lock_guard<mutex> guard(_lock);
    auto it = _calls.find(callId);
    if (it == _calls.end())
        return nullptr;
    return it->second.session;
}

bool CallManager::getRecord(const string& callId, CallRecord& out) {
    lock_guard<mutex> guard(_lock);
    auto it = _calls.find(callId);
    if (it == _calls.end())
        return false;
    out = it->second;
    return true;
}

void CallManager::endSession(const string& callId) {

    CallRecord rec;
    {
        lock_guard<mutex> guard(_lock);
        auto it = _calls.find(callId);
        if (it == _calls.end()) {
            _log.info("End of unknown call %s ignored", callId.c_str());
            return;
        }
        rec = it->second;
        _calls.erase(it);
    }

    // release() doesn't throw
    _pool.release(rec.session->id());

    _log.info("Call %s ended (session %s, %llu s)", callId.c_str(), rec.session->id().c_str(),
        (unsigned long long)((uint64_t)std::time(nullptr) - rec.startedAt));
}

void CallManager::teardownAll() {
    vector<string> ids = activeCallIds();
    if (!ids.empty())
        _log.info("Ending %u active calls", (unsigned)ids.size());
    for (const string& id : ids)
        endSession(id);
}

unsigned CallManager::activeCallCount() {
    lock_guard<mutex> guard(_lock);
    return _calls.size();
}

vector<string> CallManager::activeCallIds() {
    lock_guard<mutex> guard(_lock);
    vector<string> ids;
    for (const auto& [id, rec] : _calls)
        ids.push_back(id);
    return ids;
}

    }
}
