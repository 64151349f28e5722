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
#include <thread>

#include <nlohmann/json.hpp>

namespace httplib { class Server; }

namespace kc1fsz {

class Log;

    namespace gwbridge {

class SessionPool;
class CallManager;

/**
 * A small HTTP server for status and health checks. Runs on its own
 * thread.
 */
class StatusServer {
public:

    StatusServer(Log& log, SessionPool& pool, CallManager& calls,
        const std::string& host, unsigned port);
    ~StatusServer();

    void start();

    /**
     * Idempotent.
     */
    void stop();

    /**
     * @returns The document served at /status.
     */
    static nlohmann::json makeStatus(SessionPool& pool, CallManager& calls);

private:

    void _thread();

    Log& _log;
    SessionPool& _pool;
    CallManager& _calls;
    const std::string _host;
    const unsigned _port;
    std::unique_ptr<httplib::Server> _svr;
    std::thread _worker;
    std::atomic<bool> _started;
    std::atomic<bool> _listenReturned;
};

    }
}
