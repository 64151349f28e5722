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
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <ixwebsocket/IXWebSocketServer.h>

#include "gwbridge/GatewayLink.h"

#include "Runnable2.h"
#include "GatewayConnection.h"

namespace kc1fsz {

class Log;
class Clock;

    namespace gwbridge {

class CallManager;
class InboundRouter;
class ToolExecutor;

/**
 * Accepts WebSocket connections from gateway devices. Each connection
 * gets a GatewayConnection and a worker thread to drive it.
 *
 * Finished workers are joined on the one second tick, so the supervisor
 * loop must be running this.
 */
class GatewayServer : public Runnable2 {
public:

    static const char* PATH;

    GatewayServer(Log& log, Clock& clock, const std::string& host, unsigned port,
        unsigned maxConnections, CallManager& calls, InboundRouter* router,
        ToolExecutor* tools, const BridgeSettings& settings);
    ~GatewayServer();

    /**
     * @throws BridgeError if the port can't be bound.
     */
    void start();

    /**
     * Closes every connection, which ends every call. Idempotent.
     */
    void stop();

    unsigned connectionCount();

    // ----- Runnable2 --------------------------------------------------------

    void oneSecTick();
    void tenSecTick();

private:

    /**
     * The IX socket is only valid until its Close event, after which
     * everything sent here is dropped.
     */
    class IxLink : public GatewayLink {
    public:
        IxLink(ix::WebSocket& ws) : _ws(&ws) { }
        bool sendText(const std::string& text);
        bool sendBinary(const uint8_t* data, unsigned len);
        void close();
        void detach();
    private:
        std::mutex _lock;
        ix::WebSocket* _ws;
    };

    struct Worker {
        std::string id;
        std::unique_ptr<IxLink> link;
        std::unique_ptr<GatewayConnection> conn;
        std::thread thread;
    };

    void _onMessage(std::shared_ptr<ix::ConnectionState> state, ix::WebSocket& ws,
        const ix::WebSocketMessagePtr& msg);
    void _onOpen(const std::string& id, ix::WebSocket& ws, const std::string& uri);
    static void _workerLoop(Worker* w);
    unsigned _reap();

    Log& _log;
    Clock& _clock;
    const std::string _host;
    const unsigned _port;
    CallManager& _calls;
    InboundRouter* _router;
    ToolExecutor* _tools;
    const BridgeSettings _settings;
    ix::WebSocketServer _server;
    std::atomic<bool> _running;

    std::mutex _lock;
    std::map<std::string, std::shared_ptr<Worker>> _workers;
    unsigned _acceptedCount = 0;
    unsigned _refusedCount = 0;
};

    }
}
