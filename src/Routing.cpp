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
#include <cstdio>

#include "gwbridge/Routing.h"

using namespace std;

namespace kc1fsz {
    namespace gwbridge {

const char* matchTypeName(MatchType t) {
    switch (t) {
        case MatchType::ALL: return "all";
        case MatchType::PREFIX: return "prefix";
        case MatchType::EXACT: return "exact";
        case MatchType::CONTACT_ONLY: return "contact_only";
    }
    return "";
}

const char* routingActionName(RoutingAction a) {
    switch (a) {
        case RoutingAction::ANSWER: return "answer";
        case RoutingAction::REJECT: return "reject";
        case RoutingAction::FORWARD: return "forward";
    }
    return "";
}

bool parseMatchType(const string& s, MatchType& out) {
    for (MatchType t : { MatchType::ALL, MatchType::PREFIX, MatchType::EXACT, MatchType::CONTACT_ONLY }) {
        if (s == matchTypeName(t)) {
            out = t;
            return true;
        }
    }
    return false;
}

bool parseRoutingAction(const string& s, RoutingAction& out) {
    for (RoutingAction a : { RoutingAction::ANSWER, RoutingAction::REJECT, RoutingAction::FORWARD }) {
        if (s == routingActionName(a)) {
            out = a;
            return true;
        }
    }
    return false;
}

int parseTimeOfDay(const string& s) {
    int h = 0, m = 0, sec = 0;
    char extra = 0;
    int n = sscanf(s.c_str(), "%d:%d:%d%c", &h, &m, &sec, &extra);
    if (n != 2 && n != 3)
        return -1;
    if (h < 0 || h > 23 || m < 0 || m > 59 || sec < 0 || sec > 59)
        return -1;
    return h * 3600 + m * 60 + sec;
}

TimeOfWeek TimeOfWeek::nowUtc() {
    time_t now = time(nullptr);
    struct tm t;
    gmtime_r(&now, &t);
    TimeOfWeek r;
    r.secondOfDay = t.tm_hour * 3600 + t.tm_min * 60 + t.tm_sec;
    // tm_wday is 0=Sunday
    r.dayOfWeek = (t.tm_wday + 6) % 7;
    return r;
}

    }
}
