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
#include <vector>
#include <optional>

namespace kc1fsz {
    namespace gwbridge {

enum class MatchType {
    ALL,
    PREFIX,
    EXACT,
    CONTACT_ONLY
};

enum class RoutingAction {
    ANSWER,
    REJECT,
    FORWARD
};

const char* matchTypeName(MatchType t);
const char* routingActionName(RoutingAction a);

/**
 * @returns false if the string is not a known value (out is untouched).
 */
bool parseMatchType(const std::string& s, MatchType& out);
bool parseRoutingAction(const std::string& s, RoutingAction& out);

/**
 * Parses "HH:MM" or "HH:MM:SS".
 *
 * @returns Seconds since midnight, or -1 if the string is malformed.
 */
int parseTimeOfDay(const std::string& s);

/**
 * A registered gateway device (i.e. a phone with a SIM in it).
 */
struct GatewayDevice {
    std::string id;
    std::string gatewayId;
    std::string orgId;
    std::string phoneNumber;
    std::string label;
    bool autoAnswer = true;
    bool isActive = true;
    std::string systemInstruction;
    std::string voiceName;
};

struct Contact {
    std::string id;
    std::string orgId;
    std::string phone;
    std::string name;
};

struct RoutingRule {
    std::string id;
    std::string orgId;
    std::string name;
    // No pattern matches everything for PREFIX and nothing for EXACT
    std::optional<std::string> callerPattern;
    MatchType matchType = MatchType::ALL;
    RoutingAction action = RoutingAction::ANSWER;
    std::string forwardTo;
    std::string systemInstruction;
    std::string voiceName;
    // Seconds since midnight, -1 if not set
    int timeStartSec = -1;
    int timeEndSec = -1;
    // 0=Monday ... 6=Sunday. Missing means every day, an empty
    // list means no day.
    std::optional<std::vector<int>> daysOfWeek;
    bool isActive = true;
    // Lower is evaluated first
    int priority = 0;
};

/**
 * The metadata the gateway sends when a call starts ringing.
 */
struct IncomingCall {
    std::string callId;
    std::string fromNumber;
    std::string toNumber;
    std::string carrier;
    int simSlot = 0;
    std::string gatewayId;
};

struct RoutingDecision {
    RoutingAction action = RoutingAction::ANSWER;
    std::string callId;
    std::string orgId;
    std::string contactId;
    std::string contactName;
    std::string ruleId;
    std::string ruleName;
    std::string forwardTo;
    std::string systemInstruction;
    std::string voiceName;
    std::string rejectReason;
};

/**
 * The time used for window/day checks.
 */
struct TimeOfWeek {
    // Seconds since midnight
    int secondOfDay = 0;
    // 0=Monday ... 6=Sunday
    int dayOfWeek = 0;

    /**
     * @returns The current UTC time.
     */
    static TimeOfWeek nowUtc();
};

    }
}
