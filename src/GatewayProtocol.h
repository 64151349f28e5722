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

#include <string>

#include "gwbridge/Routing.h"

namespace kc1fsz {
    namespace gwbridge {

/**
 * JSON control frames exchanged with the gateway device. Audio goes in
 * binary frames and doesn't appear here.
 *
 * The field names and type strings are fixed by the devices in the
 * field and must not change.
 */
enum class InboundType {
    INCOMING_CALL,
    CALL_CONNECTED,
    CALL_ENDED
};

struct InboundFrame {
    InboundType type = InboundType::INCOMING_CALL;
    // INCOMING_CALL only
    IncomingCall incoming;
    std::string callId;
    // CALL_CONNECTED only
    std::string callerNumber;
    std::string gatewayId;
    // CALL_ENDED only
    std::string reason;
};

/**
 * @returns false if the text isn't a valid inbound frame, with the
 * reason in err.
 */
bool parseInboundFrame(const std::string& text, InboundFrame& out, std::string& err);

std::string makeAnswerCall(const std::string& callId);
std::string makeRejectCall(const std::string& callId, const std::string& reason);
std::string makeForwardCall(const std::string& callId, const std::string& forwardTo);
std::string makeSessionReady(const std::string& callId, const std::string& sessionId);
std::string makeSessionError(const std::string& callId, const std::string& error);

/**
 * Empty transcripts are sent as null.
 */
std::string makeTurnComplete(const std::string& callId, const std::string& outputTranscript,
    const std::string& inputTranscript, bool wasInterrupted);

/**
 * @param speaker "caller" or "agent"
 */
std::string makeCallTranscript(const std::string& callId, const char* speaker,
    const std::string& text);

/**
 * @param status "executing" or "completed"
 */
std::string makeToolExecution(const std::string& callId, const std::string& toolName,
    const std::string& toolCallId, const char* status);

    }
}
