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

#include "kc1fsz-tools/Log.h"

#include "gwbridge/Directory.h"

#include "ToolExecutor.h"

using namespace std;
using json = nlohmann::json;

namespace kc1fsz {
    namespace gwbridge {

ToolExecutor::ToolExecutor(Log& log)
:   _log(log) {
}

void ToolExecutor::registerHandler(const string& name, Handler handler) {
    lock_guard<mutex> guard(_lock);
    _handlers[name] = handler;
}

void ToolExecutor::registerStandardTools(Directory& dir, unsigned lookupTimeoutMs) {

    registerHandler("lookup_account", [&dir, lookupTimeoutMs](const json& args) {
        string phone = args.value("phone_number", "");
        if (phone.empty())
            return json({ { "error", "phone_number is required" } });
        auto f = dir.findContactByPhone(phone);
        if (f.wait_for(chrono::milliseconds(lookupTimeoutMs)) != future_status::ready)
            return json({ { "error", "Account lookup timed out" } });
        optional<Contact> contact = f.get();
        if (!contact)
            return json({ { "found", false },
                { "message", "No account found for phone number " + phone } });
        return json({
            { "found", true },
            { "account_id", contact->id },
            { "org_id", contact->orgId },
            { "name", contact->name.empty() ? string("Unknown") : contact->name },
            { "phone", contact->phone }
        });
    });

    // The actual transfer is up to the gateway, this just records the intent
    registerHandler("transfer_to_human", [](const json& args) {
        return json({
            { "action", "transfer_to_human" },
            { "reason", args.value("reason", "unspecified") },
            { "summary", args.value("summary", "") },
            { "status", "transfer_requested" }
        });
    });
}

ToolResult ToolExecutor::execute(const ToolCall& call) {

    _log.info("Executing tool %s (call_id=%s, args=%s)", call.name.c_str(), call.id.c_str(),
        call.args.dump().c_str());

    Handler handler;
    {
        lock_guard<mutex> guard(_lock);
        auto it = _handlers.find(call.name);
        if (it != _handlers.end())
            handler = it->second;
    }

    ToolResult r;
    r.id = call.id;
    r.name = call.name;

    if (!handler) {
        r.result = json({ { "error", "Unknown tool: " + call.name } });
    } else {
        try {
            r.result = handler(call.args.is_object() ? call.args : json::object());
        }
        catch (const exception& ex) {
            _log.error("Tool %s failed: %s", call.name.c_str(), ex.what());
            r.result = json({ { "error", string("Tool execution failed: ") + ex.what() } });
        }
    }

    _log.info("Tool result %s (call_id=%s): %s", call.name.c_str(), call.id.c_str(),
        r.result.dump().c_str());
    return r;
}

    }
}
