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

#include <future>
#include <string>
#include <vector>

#include "gwbridge/Routing.h"
#include "gwbridge/Directory.h"

namespace kc1fsz {

class Log;

    namespace gwbridge {

/**
 * Decides what to do with an incoming call: answer it (possibly with a
 * custom prompt/voice), reject it, or forward it somewhere else.
 *
 * Rules are evaluated in priority order and the first one that matches
 * on time window, day of week and caller wins. When nothing matches the
 * device's auto-answer flag decides.
 *
 * Routing never fails. Unknown devices, lookup problems and anything
 * else unexpected all result in the call being answered.
 */
class InboundRouter {
public:

    static const unsigned DEFAULT_LOOKUP_TIMEOUT_MS = 2000;

    InboundRouter(Log& log, Directory& dir,
        unsigned lookupTimeoutMs = DEFAULT_LOOKUP_TIMEOUT_MS);

    /**
     * Never throws.
     */
    RoutingDecision route(const IncomingCall& call, const TimeOfWeek& now);

    RoutingDecision route(const IncomingCall& call) {
        return route(call, TimeOfWeek::nowUtc());
    }

    /**
     * Writes the interaction record for the call outcome. This doesn't
     * wait for the write and a failure doesn't affect anything.
     */
    void logInteraction(const IncomingCall& call, const RoutingDecision& decision);

    /**
     * The decision logic by itself, with all of the lookups already done.
     *
     * @param contact Null if the caller isn't a known contact.
     */
    static RoutingDecision evaluate(const IncomingCall& call, const GatewayDevice& device,
        const Contact* contact, std::vector<RoutingRule> rules, const TimeOfWeek& now);

    static bool matchesTimeWindow(const RoutingRule& rule, int secondOfDay);
    static bool matchesDay(const RoutingRule& rule, int dayOfWeek);
    static bool matchesCaller(const RoutingRule& rule, const std::string& callerNumber,
        bool isKnownContact);

private:

    template <class T> T _wait(std::future<T> f, const char* what);

    Log& _log;
    Directory& _dir;
    const unsigned _lookupTimeoutMs;
};

    }
}
