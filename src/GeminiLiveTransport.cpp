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
#include <cstdlib>

#include "kc1fsz-tools/Log.h"

#include "gwbridge/Errors.h"

#include "Base64.h"
#include "Catalog.h"
#include "GeminiLiveTransport.h"

using namespace std;
using json = nlohmann::json;

namespace kc1fsz {
    namespace gwbridge {

// Looks for "rate=NNNN" in a mime type like "audio/pcm;rate=24000"
static unsigned parseMimeRate(const string& mimeType, unsigned defaultRate) {
    auto p = mimeType.find("rate=");
    if (p == string::npos)
        return defaultRate;
    unsigned r = strtoul(mimeType.c_str() + p + 5, 0, 10);
    return r == 0 ? defaultRate : r;
}

TransportFactory GeminiLiveTransport::factory(Log& log, const UpstreamSettings& settings) {
    return [&log, settings](const SessionConfig& cfg) {
        return std::unique_ptr<StreamingTransport>(new GeminiLiveTransport(log, cfg, settings));
    };
}

json GeminiLiveTransport::makeSetup(const SessionConfig& cfg, const string& resumptionToken) {

    json gen;
    gen["temperature"] = cfg.temperature;
    if (cfg.outputMode == OutputMode::HYBRID) {
        // Text only, speech is made locally
        gen["responseModalities"] = json::array({ "TEXT" });
    } else {
        gen["responseModalities"] = json::array({ "AUDIO" });
        gen["speechConfig"]["voiceConfig"]["prebuiltVoiceConfig"]["voiceName"] = cfg.voiceName;
    }

    json setup;
    string model = cfg.modelId;
    if (model.rfind("models/", 0) != 0)
        model = "models/" + model;
    setup["model"] = model;
    setup["generationConfig"] = gen;

    if (!cfg.systemInstruction.empty()) {
        setup["systemInstruction"]["role"] = "user";
        setup["systemInstruction"]["parts"] = json::array({ { { "text", cfg.systemInstruction } } });
    }
    if (cfg.inputTranscription)
        setup["inputAudioTranscription"] = json::object();
    if (cfg.outputTranscription)
        setup["outputAudioTranscription"] = json::object();
    if (!cfg.toolNames.empty()) {
        json tool;
        tool["functionDeclarations"] = toolDeclarations(cfg.toolNames);
        setup["tools"] = json::array({ tool });
    }

    // Always asked for so that the session can be extended later
    if (resumptionToken.empty())
        setup["sessionResumption"] = json::object();
    else
        setup["sessionResumption"]["handle"] = resumptionToken;

    json msg;
    msg["setup"] = setup;
    return msg;
}

bool GeminiLiveTransport::parseServerMessage(const json& msg, unsigned defaultRate,
    AgentResponse& out, string& newToken) {

    bool populated = false;

    if (msg.contains("serverContent") && msg["serverContent"].is_object()) {
        const json& sc = msg["serverContent"];
        if (sc.contains("modelTurn") && sc["modelTurn"].contains("parts")) {
            for (const json& part : sc["modelTurn"]["parts"]) {
                if (part.contains("inlineData")) {
                    const json& d = part["inlineData"];
                    vector<uint8_t> pcm;
                    if (base64Decode(d.value("data", ""), pcm) && !pcm.empty()) {
                        out.audioRate = parseMimeRate(d.value("mimeType", ""), defaultRate);
                        out.audio.insert(out.audio.end(), pcm.begin(), pcm.end());
                        populated = true;
                    }
                }
                if (part.contains("text") && part["text"].is_string()) {
                    out.text += part["text"].get<string>();
                    populated = true;
                }
            }
        }
        if (sc.contains("inputTranscription")) {
            out.inputTranscript = sc["inputTranscription"].value("text", "");
            if (!out.inputTranscript.empty())
                populated = true;
        }
        if (sc.contains("outputTranscription")) {
            out.outputTranscript = sc["outputTranscription"].value("text", "");
            if (!out.outputTranscript.empty())
                populated = true;
        }
        if (sc.value("turnComplete", false)) {
            out.turnComplete = true;
            populated = true;
        }
        if (sc.value("interrupted", false)) {
            out.interrupted = true;
            populated = true;
        }
    }

    if (msg.contains("toolCall") && msg["toolCall"].contains("functionCalls")) {
        for (const json& fc : msg["toolCall"]["functionCalls"]) {
            ToolCall c;
            c.id = fc.value("id", "");
            c.name = fc.value("name", "");
            c.args = fc.contains("args") ? fc["args"] : json::object();
            out.toolCalls.push_back(c);
            populated = true;
        }
    }

    if (msg.contains("sessionResumptionUpdate")) {
        const json& u = msg["sessionResumptionUpdate"];
        if (u.value("resumable", true) && u.contains("newHandle") && u["newHandle"].is_string())
            newToken = u["newHandle"].get<string>();
    }

    return populated;
}

GeminiLiveTransport::GeminiLiveTransport(Log& log, const SessionConfig& cfg,
    const UpstreamSettings& settings)
:   _log(log),
    _config(cfg),
    _settings(settings),
    _open(false),
    _closed(false) {
}

GeminiLiveTransport::~GeminiLiveTransport() {
    close();
}

void GeminiLiveTransport::connect(const string& resumptionToken) {

    if (_settings.apiKey.empty())
        throw TransportError("No upstream API key is configured");
    if (_closed)
        throw TransportError("Transport has already been closed");

    {
        lock_guard<mutex> lock(_lock);
        // May throw ConfigurationError on an unknown tool
        _pendingSetup = makeSetup(_config, resumptionToken).dump();
        _setupComplete = false;
        _failed = false;
        _failReason.clear();
    }

    _ws.setUrl(_settings.url + "?key=" + _settings.apiKey);
    _ws.disableAutomaticReconnection();
    _ws.setOnMessageCallback([this](const ix::WebSocketMessagePtr& msg) {
        _onMessage(msg);
    });
    _ws.start();

    unique_lock<mutex> lock(_lock);
    bool done = _setupCv.wait_for(lock, chrono::milliseconds(_settings.connectTimeoutMs),
        [this]() { return _setupComplete || _failed; });
    if (!done || _failed) {
        string reason = done ? _failReason : string("Timed out waiting for setup");
        lock.unlock();
        close();
        throw TransportError("Connect failed for " + _config.sessionId + ": " + reason);
    }
    _open = true;
    _log.info("Upstream %s connected (model=%s, voice=%s, resumed=%s)",
        _config.sessionId.c_str(), _config.modelId.c_str(), _config.voiceName.c_str(),
        resumptionToken.empty() ? "no" : "yes");
}

void GeminiLiveTransport::_onMessage(const ix::WebSocketMessagePtr& msg) {
    if (msg->type == ix::WebSocketMessageType::Open) {
        string setup;
        {
            lock_guard<mutex> lock(_lock);
            setup = _pendingSetup;
        }
        if (!_ws.sendText(setup).success) {
            lock_guard<mutex> lock(_lock);
            _failed = true;
            _failReason = "Setup send failed";
            _setupCv.notify_all();
        }
    }
    else if (msg->type == ix::WebSocketMessageType::Message) {
        _handleServerText(msg->str);
    }
    else if (msg->type == ix::WebSocketMessageType::Error) {
        _log.error("Upstream %s error: %s (http=%d)", _config.sessionId.c_str(),
            msg->errorInfo.reason.c_str(), msg->errorInfo.http_status);
        _open = false;
        lock_guard<mutex> lock(_lock);
        _failed = true;
        _failReason = msg->errorInfo.reason;
        _setupCv.notify_all();
    }
    else if (msg->type == ix::WebSocketMessageType::Close) {
        if (!_closed)
            _log.info("Upstream %s closed by remote (%d %s)", _config.sessionId.c_str(),
                (int)msg->closeInfo.code, msg->closeInfo.reason.c_str());
        _open = false;
        lock_guard<mutex> lock(_lock);
        if (!_setupComplete) {
            _failed = true;
            _failReason = "Closed during setup: " + msg->closeInfo.reason;
        }
        _setupCv.notify_all();
    }
}

void GeminiLiveTransport::_handleServerText(const string& text) {

    json msg;
    try {
        msg = json::parse(text);
    }
    catch (const json::exception& ex) {
        _log.error("Upstream %s sent bad JSON: %s", _config.sessionId.c_str(), ex.what());
        return;
    }

    if (msg.contains("setupComplete")) {
        lock_guard<mutex> lock(_lock);
        _setupComplete = true;
        _setupCv.notify_all();
        return;
    }

    if (msg.contains("goAway")) {
        const json& g = msg["goAway"];
        string left = g.contains("timeLeft") ? g["timeLeft"].dump() : string("?");
        _log.info("Upstream %s going away, time left %s", _config.sessionId.c_str(), left.c_str());
    }

    AgentResponse r;
    string token;
    bool populated = false;
    try {
        populated = parseServerMessage(msg, _settings.outputRate, r, token);
    }
    catch (const json::exception& ex) {
        _log.error("Upstream %s message not understood: %s", _config.sessionId.c_str(), ex.what());
        return;
    }

    if (!token.empty()) {
        lock_guard<mutex> lock(_lock);
        _resumptionToken = token;
    }
    if (populated)
        _responses.push(r);
}

void GeminiLiveTransport::_send(const json& msg) {
    if (!_open)
        throw TransportError("Not connected");
    if (!_ws.sendText(msg.dump()).success)
        throw TransportError("Send failed");
}

void GeminiLiveTransport::sendAudio(const uint8_t* data, unsigned len) {
    json msg;
    msg["realtimeInput"]["audio"]["data"] = base64Encode(data, len);
    msg["realtimeInput"]["audio"]["mimeType"] = "audio/pcm;rate=" + to_string(_settings.inputRate);
    _send(msg);
}

void GeminiLiveTransport::sendAudioEnd() {
    json msg;
    msg["realtimeInput"]["audioStreamEnd"] = true;
    _send(msg);
}

void GeminiLiveTransport::sendText(const string& text) {
    json turn;
    turn["role"] = "user";
    turn["parts"] = json::array({ { { "text", text } } });
    json msg;
    msg["clientContent"]["turns"] = json::array({ turn });
    msg["clientContent"]["turnComplete"] = true;
    _send(msg);
}

void GeminiLiveTransport::sendToolResponse(const vector<ToolResult>& results) {
    json a = json::array();
    for (const ToolResult& r : results)
        a.push_back({ { "id", r.id }, { "name", r.name }, { "response", r.result } });
    json msg;
    msg["toolResponse"]["functionResponses"] = a;
    _send(msg);
}

bool GeminiLiveTransport::receive(AgentResponse& out, unsigned timeoutMs) {
    return _responses.try_pop(out, timeoutMs);
}

string GeminiLiveTransport::resumptionToken() const {
    lock_guard<mutex> lock(_lock);
    return _resumptionToken;
}

void GeminiLiveTransport::close() {
    if (_closed.exchange(true))
        return;
    _open = false;
    // Blocks until the socket thread has exited
    _ws.stop();
}

    }
}
