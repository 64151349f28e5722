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
#include <iostream>

#include <nlohmann/json.hpp>

#include "ThreadUtil.h"
#include "ServiceLog.h"

#define API_KEY_HEADER ("Api-Key")

using namespace std;
using json = nlohmann::json;

namespace kc1fsz {
    namespace gwbridge {

const char* ServiceLog::DEFAULT_INGEST_URL = "https://log-api.newrelic.com/log/v1";

ServiceLog::ServiceLog(const string& serviceName, const string& env,
    const string& apiKey, const string& ingestUrl)
:   _serviceName(serviceName),
    _env(env),
    _apiKey(apiKey),
    _url(ingestUrl),
    _run(true),
    _failed(0) {
    if (!_apiKey.empty())
        _thread = std::thread(&ServiceLog::_worker, this);
}

ServiceLog::~ServiceLog() {
    stop();
}

void ServiceLog::stop() {
    _run = false;
    if (_thread.joinable())
        _thread.join();
}

void ServiceLog::_out(const char* sev, const char* dt, const char* msg) {
    char tid[16];
    getThreadName(tid, sizeof(tid));
    {
        lock_guard<mutex> lock(_outLock);
        std::cout << tid << " " << sev << ": " << dt << " " << msg << std::endl;
    }
    if (!_apiKey.empty() && _run)
        _queue.push(pair<string, string>(string(sev), string(msg)));
}

void ServiceLog::_worker() {

    setThreadName("log");
    lowerThreadPriority();

    CURL* curl = curl_easy_init();
    if (!curl) {
        std::cout << "Log shipping disabled, curl init failed" << std::endl;
        return;
    }

    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, _writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, this);
    // Cache the CA cert bundle in memory for a week
    curl_easy_setopt(curl, CURLOPT_CA_CACHE_TIMEOUT, 604800L);
    curl_slist* headers = curl_slist_append(0, "Content-Type: application/json");
    string keyHeader = string(API_KEY_HEADER) + string(": ") + _apiKey;
    headers = curl_slist_append(headers, keyHeader.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_URL, _url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 15L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 15L);

    pair<string, string> item;
    while (_run) {
        if (_queue.try_pop(item, 250))
            if (!_ship(curl, item.first, item.second))
                _failed++;
    }
    // Drain
    while (_queue.try_pop(item, 0))
        if (!_ship(curl, item.first, item.second))
            _failed++;

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
}

bool ServiceLog::_ship(CURL* curl, const string& level, const string& msg) {

    json o;
    o["message"] = msg;
    o["level"] = level;
    o["service"] = _serviceName;
    o["env"] = _env;
    string body = o.dump();

    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, (long)body.length());
    CURLcode res = curl_easy_perform(curl);
    // Never through _out(), that would feed the queue we are draining
    if (res != CURLE_OK) {
        std::cout << "Log shipping failed: " << curl_easy_strerror(res) << std::endl;
        return false;
    }
    long httpCode = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);
    if (httpCode != 200 && httpCode != 202) {
        std::cout << "Log shipping failed: HTTP " << httpCode << std::endl;
        return false;
    }
    return true;
}

// The response body isn't used
size_t ServiceLog::_writeCallback(void*, size_t size, size_t nmemb, void*) {
    return size * nmemb;
}

    }
}
