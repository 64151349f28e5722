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

#include <mutex>
#include <atomic>
#include <string>
#include <condition_variable>

#include <ixwebsocket/IXWebSocket.h>
#include <nlohmann/json.hpp>

#include "kc1fsz-tools/threadsafequeue2.h"

#include "gwbridge/SessionConfig.h"
#include "gwbridge/StreamingTransport.h"

namespace kc1fsz {

class Log;

    namespace gwbridge {

struct UpstreamSettings {
    std::string url;
    std::string apiKey;
    // Rate of the audio we send
    unsigned inputRate = 16000;
    // Rate assumed for received audio when the mime type doesn't say
    unsigned outputRate = 24000;
    unsigned connectTimeoutMs = 10000;
};

/**
 * A StreamingTransport for the Gemini Live (BidiGenerateContent) API
 * over a WebSocket. Audio is carried as base64 PCM inside of JSON
 * messages in both directions.
 *
 * Responses are parsed on the WebSocket's own thread and queued for
 * receive().
 */
class GeminiLiveTransport : public StreamingTransport {
public:

    GeminiLiveTransport(Log& log, const SessionConfig& cfg, const UpstreamSettings& settings);
    virtual ~GeminiLiveTransport();

    /**
     * @returns A factory that makes one of these per connection.
     */
    static TransportFactory factory(Log& log, const UpstreamSettings& settings);

    /**
     * @returns The setup message for the config and resumption token.
     */
    static nlohmann::json makeSetup(const SessionConfig& cfg, const std::string& resumptionToken);

    /**
     * Parses one server message.
     *
     * @param out Receives the response, if the message carried one.
     * @param newToken Receives a new resumption token, if the message carried one.
     * @returns true if out was populated.
     */
    static bool parseServerMessage(const nlohmann::json& msg, unsigned defaultRate,
        AgentResponse& out, std::string& newToken);

    // ----- StreamingTransport -----------------------------------------------

    void connect(const std::string& resumptionToken);
    void sendAudio(const uint8_t* data, unsigned len);
    void sendAudioEnd();
    void sendText(const std::string& text);
    void sendToolResponse(const std::vector<ToolResult>& results);
    bool receive(AgentResponse& out, unsigned timeoutMs);
    bool isOpen() const { return _open.load(); }
    std::string resumptionToken() const;
    void close();

private:

    void _onMessage(const ix::WebSocketMessagePtr& msg);
    void _handleServerText(const std::string& text);
    void _send(const nlohmann::json& msg);

    Log& _log;
    const SessionConfig _config;
    const UpstreamSettings _settings;
    ix::WebSocket _ws;

    mutable std::mutex _lock;
    std::condition_variable _setupCv;
    std::string _pendingSetup;
    bool _setupComplete = false;
    bool _failed = false;
    std::string _failReason;
    std::string _resumptionToken;

    std::atomic<bool> _open;
    std::atomic<bool> _closed;
    threadsafequeue2<AgentResponse> _responses;
};

    }
}
