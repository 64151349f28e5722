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
#include <fstream>
#include <type_traits>

#include "kc1fsz-tools/Log.h"

#include "ThreadUtil.h"
#include "JsonDirectory.h"

using namespace std;
using json = nlohmann::json;

namespace kc1fsz {
    namespace gwbridge {

// Missing and null both come back as empty
static string optString(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return string();
    return it->get<string>();
}

static bool optBool(const json& j, const char* key, bool def) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return def;
    return it->get<bool>();
}

JsonDirectory::JsonDirectory(Log& log, const string& interactionLogFile)
:   _log(log),
    _interactionLogFile(interactionLogFile),
    _data(make_shared<Snapshot>()),
    _run(true),
    _worker(&JsonDirectory::_loop, this) {
}

JsonDirectory::~JsonDirectory() {
    _run = false;
    _worker.join();
}

bool JsonDirectory::parseGateway(const json& j, GatewayDevice& dev, string& err) {
    try {
        dev.id = optString(j, "id");
        dev.gatewayId = optString(j, "gateway_id");
        dev.orgId = optString(j, "org_id");
        dev.phoneNumber = optString(j, "phone_number");
        dev.label = optString(j, "label");
        dev.autoAnswer = optBool(j, "auto_answer", true);
        dev.isActive = optBool(j, "is_active", true);
        dev.systemInstruction = optString(j, "system_instruction");
        dev.voiceName = optString(j, "voice_name");
    }
    catch (const json::exception& ex) {
        err = ex.what();
        return false;
    }
    if (dev.gatewayId.empty()) {
        err = "gateway_id is required";
        return false;
    }
    return true;
}

bool JsonDirectory::parseRule(const json& j, RoutingRule& rule, string& err) {
    try {
        rule.id = optString(j, "id");
        rule.orgId = optString(j, "org_id");
        rule.name = optString(j, "name");

        auto p = j.find("caller_pattern");
        if (p != j.end() && !p->is_null())
            rule.callerPattern = p->get<string>();

        string matchType = optString(j, "match_type");
        if (matchType.empty())
            matchType = "all";
        if (!parseMatchType(matchType, rule.matchType)) {
            err = "unknown match_type " + matchType;
            return false;
        }

        string action = optString(j, "action");
        if (action.empty())
            action = "answer";
        if (!parseRoutingAction(action, rule.action)) {
            err = "unknown action " + action;
            return false;
        }

        rule.forwardTo = optString(j, "forward_to");
        rule.systemInstruction = optString(j, "system_instruction");
        rule.voiceName = optString(j, "voice_name");

        string ts = optString(j, "time_start");
        if (!ts.empty()) {
            rule.timeStartSec = parseTimeOfDay(ts);
            if (rule.timeStartSec < 0) {
                err = "bad time_start " + ts;
                return false;
            }
        }
        string te = optString(j, "time_end");
        if (!te.empty()) {
            rule.timeEndSec = parseTimeOfDay(te);
            if (rule.timeEndSec < 0) {
                err = "bad time_end " + te;
                return false;
            }
        }

        auto days = j.find("days_of_week");
        if (days != j.end() && days->is_array()) {
            rule.daysOfWeek = vector<int>();
            for (const auto& d : *days) {
                int day = d.get<int>();
                if (day < 0 || day > 6) {
                    err = "bad day of week " + to_string(day);
                    return false;
                }
                rule.daysOfWeek->push_back(day);
            }
        }

        rule.isActive = optBool(j, "is_active", true);
        auto prio = j.find("priority");
        rule.priority = (prio == j.end() || prio->is_null()) ? 0 : prio->get<int>();
    }
    catch (const json::exception& ex) {
        err = ex.what();
        return false;
    }
    if (rule.orgId.empty()) {
        err = "org_id is required";
        return false;
    }
    return true;
}

void JsonDirectory::load(const json& doc) {

    auto snap = make_shared<Snapshot>();

    if (doc.contains("gateways")) {
        for (const auto& g : doc["gateways"]) {
            GatewayDevice dev;
            string err;
            if (parseGateway(g, dev, err))
                snap->gateways.push_back(dev);
            else
                _log.error("Gateway entry skipped: %s", err.c_str());
        }
    }

    if (doc.contains("contacts")) {
        for (const auto& c : doc["contacts"]) {
            try {
                Contact contact;
                contact.id = optString(c, "id");
                contact.orgId = optString(c, "org_id");
                contact.phone = optString(c, "phone");
                contact.name = optString(c, "name");
                snap->contacts.push_back(contact);
            }
            catch (const json::exception& ex) {
                _log.error("Contact entry skipped: %s", ex.what());
            }
        }
    }

    if (doc.contains("rules")) {
        for (const auto& r : doc["rules"]) {
            RoutingRule rule;
            string err;
            if (parseRule(r, rule, err))
                snap->rules.push_back(rule);
            else
                _log.error("Routing rule %s skipped: %s", optString(r, "name").c_str(), err.c_str());
        }
    }

    _log.info("Directory loaded: %u gateways, %u contacts, %u rules",
        (unsigned)snap->gateways.size(), (unsigned)snap->contacts.size(),
        (unsigned)snap->rules.size());

    lock_guard<mutex> guard(_lock);
    _data = snap;
}

shared_ptr<const JsonDirectory::Snapshot> JsonDirectory::_current() {
    lock_guard<mutex> guard(_lock);
    return _data;
}

unsigned JsonDirectory::gatewayCount() {
    return _current()->gateways.size();
}

unsigned JsonDirectory::ruleCount() {
    return _current()->rules.size();
}

template <class T> future<T> JsonDirectory::_submit(function<T(const Snapshot&)> fn) {
    auto p = make_shared<promise<T>>();
    future<T> f = p->get_future();
    _jobs.push([this, p, fn]() {
        try {
            shared_ptr<const Snapshot> snap = _current();
            if constexpr (is_void_v<T>) {
                fn(*snap);
                p->set_value();
            } else {
                p->set_value(fn(*snap));
            }
        }
        catch (const exception&) {
            p->set_exception(current_exception());
        }
    });
    return f;
}

future<optional<GatewayDevice>> JsonDirectory::findGateway(const string& gatewayId) {
    return _submit<optional<GatewayDevice>>([gatewayId](const Snapshot& s) {
        for (const auto& g : s.gateways)
            if (g.gatewayId == gatewayId)
                return optional<GatewayDevice>(g);
        return optional<GatewayDevice>();
    });
}

future<optional<Contact>> JsonDirectory::findContact(const string& orgId, const string& phone) {
    return _submit<optional<Contact>>([orgId, phone](const Snapshot& s) {
        for (const auto& c : s.contacts)
            if (c.orgId == orgId && c.phone == phone)
                return optional<Contact>(c);
        return optional<Contact>();
    });
}

future<optional<Contact>> JsonDirectory::findContactByPhone(const string& phone) {
    return _submit<optional<Contact>>([phone](const Snapshot& s) {
        for (const auto& c : s.contacts)
            if (c.phone == phone)
                return optional<Contact>(c);
        return optional<Contact>();
    });
}

future<vector<RoutingRule>> JsonDirectory::activeRules(const string& orgId) {
    return _submit<vector<RoutingRule>>([orgId](const Snapshot& s) {
        vector<RoutingRule> result;
        for (const auto& r : s.rules)
            if (r.orgId == orgId && r.isActive)
                result.push_back(r);
        return result;
    });
}

future<void> JsonDirectory::appendInteraction(const InteractionRecord& rec) {
    return _submit<void>([this, rec](const Snapshot&) {
        _writeInteraction(rec);
    });
}

void JsonDirectory::_writeInteraction(const InteractionRecord& rec) {

    if (_interactionLogFile.empty())
        return;

    json o;
    o["org_id"] = rec.orgId;
    o["contact_id"] = rec.contactId.empty() ? json() : json(rec.contactId);
    o["type"] = rec.type;
    o["status"] = rec.status;
    o["started_at"] = rec.startedAt;
    o["metadata"] = rec.metadata;

    ofstream out(_interactionLogFile, ios::app);
    if (!out) {
        _log.error("Unable to open interaction log %s", _interactionLogFile.c_str());
        throw runtime_error("Unable to open interaction log");
    }
    out << o.dump() << endl;
}

void JsonDirectory::_loop() {

    setThreadName("directory");
    lowerThreadPriority();

    while (_run.load()) {
        function<void()> job;
        // Long timeout to avoid high CPU
        if (_jobs.try_pop(job, 250))
            job();
    }

    // Anything still queued gets run so that no future is left hanging
    function<void()> job;
    while (_jobs.try_pop(job, 0))
        job();
}

    }
}
