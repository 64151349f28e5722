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
#include <mutex>
#include <string>
#include <thread>
#include <utility>

#include <curl/curl.h>

#include "kc1fsz-tools/Log.h"
#include "kc1fsz-tools/threadsafequeue2.h"

namespace kc1fsz {
    namespace gwbridge {

/**
 * The process logger. Every line goes to stdout, prefixed with the name
 * of the thread that logged it. If an API key is provided each line is
 * also shipped to a log-ingest endpoint (New Relic Log API format) on a
 * background thread, so callers never wait on the network.
 *
 * This logger is thread-safe.
 */
class ServiceLog : public Log {
public:

    static const char* DEFAULT_INGEST_URL;

    /**
     * @param apiKey Empty to log to stdout only.
     */
    ServiceLog(const std::string& serviceName, const std::string& env,
        const std::string& apiKey, const std::string& ingestUrl = DEFAULT_INGEST_URL);
    virtual ~ServiceLog();

    /**
     * Ships anything still queued and stops the background thread.
     * Idempotent.
     */
    void stop();

    unsigned failedShipments() const { return _failed.load(); }

protected:

    virtual void _out(const char* sev, const char* dt, const char* msg);

private:

    void _worker();
    bool _ship(CURL* curl, const std::string& level, const std::string& msg);

    static size_t _writeCallback(void* contents, size_t size, size_t nmemb, void* userp);

    const std::string _serviceName;
    const std::string _env;
    const std::string _apiKey;
    const std::string _url;

    std::mutex _outLock;
    std::atomic<bool> _run;
    std::atomic<unsigned> _failed;
    threadsafequeue2<std::pair<std::string, std::string>> _queue;
    std::thread _thread;
};

    }
}
