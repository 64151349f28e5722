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

#include <cstdint>
#include <string>
#include <vector>
#include <memory>
#include <functional>

#include <nlohmann/json.hpp>

namespace kc1fsz {
    namespace gwbridge {

class SessionConfig;

/**
 * A function call requested by the upstream agent in the middle of
 * a conversation.
 */
struct ToolCall {
    std::string id;
    std::string name;
    nlohmann::json args;
};

/**
 * The outcome of a ToolCall, sent back upstream.
 */
struct ToolResult {
    std::string id;
    std::string name;
    nlohmann::json result;
};

/**
 * One event received from the upstream agent. Any combination of the
 * fields may be populated.
 */
struct AgentResponse {

    // PCM16 LE mono
    std::vector<uint8_t> audio;
    // The rate of the audio above
    unsigned audioRate = 0;
    std::string text;
    std::string inputTranscript;
    std::string outputTranscript;
    bool turnComplete = false;
    bool interrupted = false;
    std::vector<ToolCall> toolCalls;

    bool hasAudio() const { return !audio.empty(); }
    bool hasText() const { return !text.empty(); }
    bool hasToolCalls() const { return !toolCalls.empty(); }
};

/**
 * The abstract interface to one upstream streaming connection. The
 * session layer doesn't know or care which vendor protocol is on the
 * other side.
 *
 * Implementations must allow the send methods and receive() to be called
 * from different threads at the same time.
 */
class StreamingTransport {
public:

    virtual ~StreamingTransport() { }

    /**
     * Blocks until the upstream has acknowledged the session setup.
     *
     * @param resumptionToken Empty for a new conversation, otherwise a
     * token previously obtained from resumptionToken() on an earlier
     * connection.
     * @throws TransportError on failure.
     */
    virtual void connect(const std::string& resumptionToken) = 0;

    /**
     * @throws TransportError if the connection is not open.
     */
    virtual void sendAudio(const uint8_t* data, unsigned len) = 0;
    virtual void sendAudioEnd() = 0;
    virtual void sendText(const std::string& text) = 0;
    virtual void sendToolResponse(const std::vector<ToolResult>& results) = 0;

    /**
     * Waits up to timeoutMs for the next response. Responses that
     * arrived before close() remain readable after close().
     *
     * @returns true if a response was written into out.
     */
    virtual bool receive(AgentResponse& out, unsigned timeoutMs) = 0;

    /**
     * @returns false once the connection has been closed by either side.
     */
    virtual bool isOpen() const = 0;

    /**
     * @returns The latest resumption token issued by the upstream, or
     * empty if none has been issued yet.
     */
    virtual std::string resumptionToken() const = 0;

    /**
     * Idempotent.
     */
    virtual void close() = 0;
};

/**
 * Makes a new (unconnected) transport. Called once per connection attempt,
 * including every extension hop.
 */
typedef std::function<std::unique_ptr<StreamingTransport>(const SessionConfig& cfg)>
    TransportFactory;

    }
}
