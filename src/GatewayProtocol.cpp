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
#include <nlohmann/json.hpp>

#include "GatewayProtocol.h"

using namespace std;
using json = nlohmann::json;

namespace kc1fsz {
    namespace gwbridge {

static string optString(const json& j, const char* key, const char* def = "") {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return string(def);
    return it->get<string>();
}

bool parseInboundFrame(const string& text, InboundFrame& out, string& err) {

    try {
        json j = json::parse(text);
        if (!j.is_object()) {
            err = "not an object";
            return false;
        }

        string type = optString(j, "type");
        out.callId = optString(j, "call_id");
        if (out.callId.empty()) {
            err = "missing call_id";
            return false;
        }

        if (type == "INCOMING_CALL") {
            out.type = InboundType::INCOMING_CALL;
            out.incoming.callId = out.callId;
            out.incoming.fromNumber = optString(j, "from_number");
            out.incoming.toNumber = optString(j, "to_number");
            out.incoming.carrier = optString(j, "carrier");
            auto slot = j.find("sim_slot");
            out.incoming.simSlot = (slot == j.end() || slot->is_null()) ? 0 : slot->get<int>();
            out.incoming.gatewayId = optString(j, "gateway_id");
            out.gatewayId = out.incoming.gatewayId;
        }
        else if (type == "CALL_CONNECTED") {
            out.type = InboundType::CALL_CONNECTED;
            out.callerNumber = optString(j, "caller_number");
            out.gatewayId = optString(j, "gateway_id");
        }
        else if (type == "CALL_ENDED") {
            out.type = InboundType::CALL_ENDED;
            out.reason = optString(j, "reason", "hangup");
        }
        else {
            err = "unknown type " + type;
            return false;
        }
    }
    catch (const json::exception& ex) {
        err = ex.what();
        return false;
    }
    return true;
}

static json base(const char* type, const string& callId) {
    json o;
    o["type"] = type;
    o["call_id"] = callId;
    return o;
}

static json orNull(const string& s) {
    return s.empty() ? json() : json(s);
}

string makeAnswerCall(const string& callId) {
    return base("ANSWER_CALL", callId).dump();
}

string makeRejectCall(const string& callId, const string& reason) {
    json o = base("REJECT_CALL", callId);
    o["reason"] = reason.empty() ? string("rejected") : reason;
    return o.dump();
}

string makeForwardCall(const string& callId, const string& forwardTo) {
    json o = base("FORWARD_CALL", callId);
    o["forward_to"] = forwardTo;
    return o.dump();
}

string makeSessionReady(const string& callId, const string& sessionId) {
    json o = base("SESSION_READY", callId);
    o["session_id"] = sessionId;
    return o.dump();
}

string makeSessionError(const string& callId, const string& error) {
    json o = base("SESSION_ERROR", callId);
    o["error"] = error;
    return o.dump();
}

string makeTurnComplete(const string& callId, const string& outputTranscript,
    const string& inputTranscript, bool wasInterrupted) {
    json o = base("TURN_COMPLETE", callId);
    o["output_transcript"] = orNull(outputTranscript);
    o["input_transcript"] = orNull(inputTranscript);
    o["was_interrupted"] = wasInterrupted;
    return o.dump();
}

string makeCallTranscript(const string& callId, const char* speaker, const string& text) {
    json o = base("CALL_TRANSCRIPT", callId);
    o["speaker"] = speaker;
    o["text"] = text;
    return o.dump();
}

string makeToolExecution(const string& callId, const string& toolName,
    const string& toolCallId, const char* status) {
    json o = base("TOOL_EXECUTION", callId);
    o["tool_name"] = toolName;
    o["tool_call_id"] = toolCallId;
    o["status"] = status;
    return o.dump();
}

    }
}
