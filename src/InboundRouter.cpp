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
#include <ctime>
#include <chrono>
#include <algorithm>

#include "kc1fsz-tools/Log.h"

#include "gwbridge/Errors.h"

#include "InboundRouter.h"

using namespace std;
using json = nlohmann::json;

namespace kc1fsz {
    namespace gwbridge {

static const int START_OF_DAY = 0;
static const int END_OF_DAY = 23 * 3600 + 59 * 60 + 59;
static const char* NO_MATCHING_RULE = "no_matching_rule";
static const char* REJECTED = "rejected";

InboundRouter::InboundRouter(Log& log, Directory& dir, unsigned lookupTimeoutMs)
:   _log(log),
    _dir(dir),
    _lookupTimeoutMs(lookupTimeoutMs) {
}

template <class T> T InboundRouter::_wait(future<T> f, const char* what) {
    if (f.wait_for(chrono::milliseconds(_lookupTimeoutMs)) != future_status::ready)
        throw RoutingEvaluationError(string("Timed out waiting for ") + what);
    try {
        return f.get();
    }
    catch (const exception& ex) {
        throw RoutingEvaluationError(string(what) + " lookup failed: " + ex.what());
    }
}

RoutingDecision InboundRouter::route(const IncomingCall& call, const TimeOfWeek& now) {

    RoutingDecision decision;
    decision.callId = call.callId;

    try {
        if (call.gatewayId.empty()) {
            _log.info("Call %s has no gateway id, answering", call.callId.c_str());
            return decision;
        }

        optional<GatewayDevice> device = _wait(_dir.findGateway(call.gatewayId), "gateway");
        if (!device || !device->isActive) {
            _log.info("Call %s from unknown/inactive gateway %s, answering", call.callId.c_str(),
                call.gatewayId.c_str());
            return decision;
        }

        optional<Contact> contact = _wait(_dir.findContact(device->orgId, call.fromNumber), "contact");
        vector<RoutingRule> rules = _wait(_dir.activeRules(device->orgId), "rules");

        decision = evaluate(call, *device, contact ? &(*contact) : nullptr, rules, now);
    }
    catch (const exception& ex) {
        _log.error("Routing failed for call %s, answering: %s", call.callId.c_str(), ex.what());
        RoutingDecision failOpen;
        failOpen.callId = call.callId;
        return failOpen;
    }

    _log.info("Call %s from %s routed: %s (rule=%s)", call.callId.c_str(), call.fromNumber.c_str(),
        routingActionName(decision.action),
        decision.ruleName.empty() ? "none" : decision.ruleName.c_str());

    return decision;
}

RoutingDecision InboundRouter::evaluate(const IncomingCall& call, const GatewayDevice& device,
    const Contact* contact, vector<RoutingRule> rules, const TimeOfWeek& now) {

    RoutingDecision d;
    d.callId = call.callId;
    d.orgId = device.orgId;
    if (contact) {
        d.contactId = contact->id;
        d.contactName = contact->name;
    }

    // Stable so that equal priorities keep the order they came in
    stable_sort(rules.begin(), rules.end(),
        [](const RoutingRule& a, const RoutingRule& b) { return a.priority < b.priority; });

    for (const RoutingRule& rule : rules) {
        if (!rule.isActive)
            continue;
        if (!matchesTimeWindow(rule, now.secondOfDay))
            continue;
        if (!matchesDay(rule, now.dayOfWeek))
            continue;
        if (!matchesCaller(rule, call.fromNumber, contact != nullptr))
            continue;

        d.action = rule.action;
        d.ruleId = rule.id;
        d.ruleName = rule.name;
        switch (rule.action) {
            case RoutingAction::ANSWER:
                d.systemInstruction = rule.systemInstruction;
                d.voiceName = rule.voiceName;
                break;
            case RoutingAction::FORWARD:
                d.forwardTo = rule.forwardTo;
                break;
            case RoutingAction::REJECT:
                d.rejectReason = REJECTED;
                break;
        }
        return d;
    }

    // Nothing matched, fall back to the device setting
    if (device.autoAnswer) {
        d.action = RoutingAction::ANSWER;
        d.systemInstruction = device.systemInstruction;
        d.voiceName = device.voiceName;
    } else {
        d.action = RoutingAction::REJECT;
        d.rejectReason = NO_MATCHING_RULE;
    }
    return d;
}

bool InboundRouter::matchesTimeWindow(const RoutingRule& rule, int t) {
    if (rule.timeStartSec < 0 && rule.timeEndSec < 0)
        return true;
    const int start = rule.timeStartSec < 0 ? START_OF_DAY : rule.timeStartSec;
    const int end = rule.timeEndSec < 0 ? END_OF_DAY : rule.timeEndSec;
    if (start <= end)
        return t >= start && t <= end;
    // Overnight (e.g. 22:00-06:00) is everything outside of [end, start)
    return t >= start || t < end;
}

bool InboundRouter::matchesDay(const RoutingRule& rule, int dayOfWeek) {
    if (!rule.daysOfWeek)
        return true;
    const vector<int>& days = *rule.daysOfWeek;
    return find(days.begin(), days.end(), dayOfWeek) != days.end();
}

bool InboundRouter::matchesCaller(const RoutingRule& rule, const string& caller,
    bool isKnownContact) {
    switch (rule.matchType) {
        case MatchType::ALL:
            return true;
        case MatchType::PREFIX: {
            if (!rule.callerPattern)
                return true;
            string prefix = *rule.callerPattern;
            while (!prefix.empty() && prefix.back() == '*')
                prefix.pop_back();
            return caller.compare(0, prefix.size(), prefix) == 0;
        }
        case MatchType::EXACT:
            return rule.callerPattern && caller == *rule.callerPattern;
        case MatchType::CONTACT_ONLY:
            return isKnownContact;
    }
    return false;
}

void InboundRouter::logInteraction(const IncomingCall& call, const RoutingDecision& d) {

    InteractionRecord rec;
    rec.orgId = d.orgId;
    rec.contactId = d.contactId;
    rec.type = "inbound_call";
    rec.status = d.action == RoutingAction::ANSWER ? "in_progress" : "completed";
    rec.startedAt = (uint64_t)std::time(nullptr);

    json m;
    m["call_id"] = call.callId;
    m["gateway_id"] = call.gatewayId;
    m["from_number"] = call.fromNumber;
    m["to_number"] = call.toNumber;
    m["carrier"] = call.carrier;
    m["sim_slot"] = call.simSlot;
    m["routing_action"] = routingActionName(d.action);
    m["routing_rule_id"] = d.ruleId.empty() ? json() : json(d.ruleId);
    m["routing_rule_name"] = d.ruleName.empty() ? json() : json(d.ruleName);
    m["forward_to"] = d.forwardTo.empty() ? json() : json(d.forwardTo);
    m["contact_name"] = d.contactName.empty() ? json() : json(d.contactName);
    rec.metadata = m;

    // Interactions belong to an organization, so there's nothing to write
    // for a call from an unknown device
    if (rec.orgId.empty())
        return;

    // Not waited on. The directory reports its own write failures.
    _dir.appendInteraction(rec);
}

    }
}
