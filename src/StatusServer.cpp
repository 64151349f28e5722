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

#include "httplib.h"

#include "kc1fsz-tools/Log.h"

#include "gwbridge/Session.h"

#include "ThreadUtil.h"
#include "SessionPool.h"
#include "CallManager.h"
#include "StatusServer.h"

using namespace std;
using json = nlohmann::json;

namespace kc1fsz {
    namespace gwbridge {

StatusServer::StatusServer(Log& log, SessionPool& pool, CallManager& calls,
    const string& host, unsigned port)
:   _log(log),
    _pool(pool),
    _calls(calls),
    _host(host),
    _port(port),
    _svr(new httplib::Server()),
    _started(false),
    _listenReturned(false) {

    _svr->Get("/status", [this](const httplib::Request&, httplib::Response& res) {
        res.set_content(makeStatus(_pool, _calls).dump(), "application/json");
    });
    _svr->Get("/health", [](const httplib::Request&, httplib::Response& res) {
        json o;
        o["status"] = "ok";
        res.set_content(o.dump(), "application/json");
    });
}

StatusServer::~StatusServer() {
    stop();
}

json StatusServer::makeStatus(SessionPool& pool, CallManager& calls) {
    json o;
    o["active_sessions"] = pool.activeCount();
    o["available_slots"] = pool.availableSlots();
    o["max_sessions"] = pool.maxSessions();
    o["active_calls"] = calls.activeCallCount();
    json sessions = json::array();
    for (const SessionInfo& info : pool.listSessions()) {
        json s;
        s["session_id"] = info.id;
        s["state"] = sessionStateName(info.state);
        s["model_id"] = info.modelId;
        s["voice_name"] = info.voiceName;
        s["output_mode"] = info.outputMode;
        s["created_at"] = info.createdAt;
        s["last_activity_at"] = info.lastActivityAt;
        s["has_resumption_token"] = info.hasResumptionToken;
        s["chunks_sent"] = info.metrics.chunksSent;
        s["chunks_received"] = info.metrics.chunksReceived;
        s["bytes_sent"] = info.metrics.bytesSent;
        s["bytes_received"] = info.metrics.bytesReceived;
        s["extensions"] = info.metrics.extensions;
        sessions.push_back(s);
    }
    o["sessions"] = sessions;
    return o;
}

void StatusServer::start() {
    if (_started.exchange(true))
        return;
    _worker = std::thread(&StatusServer::_thread, this);
}

void StatusServer::stop() {
    if (!_started.load())
        return;
    // A stop() that lands before listen() has bound is lost, so keep
    // asking until listen() has returned
    while (!_listenReturned.load()) {
        _svr->stop();
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    if (_worker.joinable())
        _worker.join();
    _started = false;
}

void StatusServer::_thread() {
    setThreadName("status");
    _log.info("Status server listening on %s:%u", _host.c_str(), _port);
    if (!_svr->listen(_host, _port))
        _log.error("Status server unable to listen on port %u", _port);
    _listenReturned = true;
    _log.info("Status server stopped");
}

    }
}
