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

#include "gwbridge/Errors.h"

#include "ThreadUtil.h"
#include "GatewayServer.h"

using namespace std;

namespace kc1fsz {
    namespace gwbridge {

const char* GatewayServer::PATH = "/api/v1/gateway/ws";

// How long a worker waits for device frames or upstream responses
static const unsigned SERVICE_WAIT_MS = 10;

bool GatewayServer::IxLink::sendText(const string& text) {
    lock_guard<mutex> lock(_lock);
    if (!_ws)
        return false;
    return _ws->sendText(text).success;
}

bool GatewayServer::IxLink::sendBinary(const uint8_t* data, unsigned len) {
    lock_guard<mutex> lock(_lock);
    if (!_ws)
        return false;
    return _ws->sendBinary(string((const char*)data, len)).success;
}

void GatewayServer::IxLink::close() {
    lock_guard<mutex> lock(_lock);
    if (_ws)
        _ws->close();
}

void GatewayServer::IxLink::detach() {
    lock_guard<mutex> lock(_lock);
    _ws = 0;
}

GatewayServer::GatewayServer(Log& log, Clock& clock, const string& host, unsigned port,
    unsigned maxConnections, CallManager& calls, InboundRouter* router,
    ToolExecutor* tools, const BridgeSettings& settings)
:   _log(log),
    _clock(clock),
    _host(host),
    _port(port),
    _calls(calls),
    _router(router),
    _tools(tools),
    _settings(settings),
    _server(port, host, ix::SocketServer::kDefaultTcpBacklog, maxConnections),
    _running(false) {
    _server.setOnClientMessageCallback(
        [this](std::shared_ptr<ix::ConnectionState> state, ix::WebSocket& ws,
            const ix::WebSocketMessagePtr& msg) {
            _onMessage(state, ws, msg);
        });
}

GatewayServer::~GatewayServer() {
    stop();
}

void GatewayServer::start() {
    auto res = _server.listen();
    if (!res.first)
        throw BridgeError("Unable to listen on " + _host + ":" + to_string(_port) + ": " +
            res.second);
    _server.start();
    _running = true;
    _log.info("Gateway server listening on %s:%u%s", _host.c_str(), _port, PATH);
}

void GatewayServer::stop() {

    if (!_running.exchange(false))
        return;

    _log.info("Gateway server stopping");
    _server.stop();

    // Anything the Close events didn't already finish
    vector<shared_ptr<Worker>> workers;
    {
        lock_guard<mutex> lock(_lock);
        for (auto& [id, w] : _workers)
            workers.push_back(w);
        _workers.clear();
    }
    for (auto& w : workers) {
        w->link->detach();
        w->conn->onClosed();
        if (w->thread.joinable())
            w->thread.join();
    }

    _log.info("Gateway server stopped");
}

unsigned GatewayServer::connectionCount() {
    lock_guard<mutex> lock(_lock);
    return _workers.size();
}

void GatewayServer::_onMessage(std::shared_ptr<ix::ConnectionState> state,
    ix::WebSocket& ws, const ix::WebSocketMessagePtr& msg) {

    const string id = state->getId();

    if (msg->type == ix::WebSocketMessageType::Open) {
        _onOpen(id, ws, msg->openInfo.uri);
        return;
    }

    shared_ptr<Worker> w;
    {
        lock_guard<mutex> lock(_lock);
        auto it = _workers.find(id);
        if (it != _workers.end())
            w = it->second;
    }
    // Refused or already stopped
    if (!w)
        return;

    if (msg->type == ix::WebSocketMessageType::Message) {
        if (msg->binary)
            w->conn->onBinary(msg->str);
        else
            w->conn->onText(msg->str);
    }
    else if (msg->type == ix::WebSocketMessageType::Close) {
        // The socket is gone once we return
        w->link->detach();
        w->conn->onClosed();
    }
    else if (msg->type == ix::WebSocketMessageType::Error) {
        _log.error("Gateway connection %s error: %s", id.c_str(), msg->errorInfo.reason.c_str());
    }
}

void GatewayServer::_onOpen(const string& id, ix::WebSocket& ws, const string& uri) {

    const string path = uri.substr(0, uri.find('?'));
    if (path != PATH) {
        _log.error("Gateway connection %s refused, bad path %s", id.c_str(), path.c_str());
        {
            lock_guard<mutex> lock(_lock);
            _refusedCount++;
        }
        ws.close(4004, "Not found");
        return;
    }

    auto w = make_shared<Worker>();
    w->id = id;
    w->link.reset(new IxLink(ws));
    w->conn.reset(new GatewayConnection(_log, _clock, id, *(w->link), _calls, _router,
        _tools, _settings));
    // Frames can't arrive for this connection until we return, so the
    // worker can be started before it is registered
    w->thread = std::thread(_workerLoop, w.get());
    lock_guard<mutex> lock(_lock);
    _workers[id] = w;
    _acceptedCount++;
}

void GatewayServer::_workerLoop(Worker* w) {
    setThreadName(("gw-" + w->id).c_str());
    while (!w->conn->isFinished())
        w->conn->service(SERVICE_WAIT_MS);
}

unsigned GatewayServer::_reap() {

    vector<shared_ptr<Worker>> finished;
    {
        lock_guard<mutex> lock(_lock);
        for (auto it = _workers.begin(); it != _workers.end(); ) {
            if (it->second->conn->isFinished()) {
                finished.push_back(it->second);
                it = _workers.erase(it);
            } else {
                it++;
            }
        }
    }
    // Joined outside of the lock since the socket thread needs it
    for (auto& w : finished)
        if (w->thread.joinable())
            w->thread.join();
    return finished.size();
}

void GatewayServer::oneSecTick() {
    unsigned n = _reap();
    if (n > 0)
        _log.info("Reaped %u finished gateway connections", n);
}

void GatewayServer::tenSecTick() {
    lock_guard<mutex> lock(_lock);
    _log.info("Gateway connections: %u active, %u accepted, %u refused",
        (unsigned)_workers.size(), _acceptedCount, _refusedCount);
}

    }
}
