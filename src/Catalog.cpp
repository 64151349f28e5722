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
#include <algorithm>

#include "gwbridge/Errors.h"

#include "Catalog.h"

using namespace std;
using json = nlohmann::json;

namespace kc1fsz {
    namespace gwbridge {

static const vector<string> VOICES = {
    "Zephyr", "Puck", "Charon", "Kore", "Fenrir", "Leda", "Orus", "Aoede",
    "Callirrhoe", "Autonoe", "Enceladus", "Iapetus", "Umbriel", "Algieba",
    "Despina", "Erinome", "Algenib", "Rasalgethi", "Laomedeia", "Achernar",
    "Alnilam", "Schedar", "Gacrux", "Pulcherrima", "Achird", "Zubenelgenubi",
    "Vindemiatrix", "Sadachbia", "Sadaltager", "Sulafat"
};

const vector<string>& voiceNames() {
    return VOICES;
}

bool isKnownVoice(const string& name) {
    return find(VOICES.begin(), VOICES.end(), name) != VOICES.end();
}

// Function declarations in the JSON-schema form that the upstream expects
static json makeLookupAccount() {
    json p;
    p["type"] = "object";
    p["properties"]["phone_number"] = {
        { "type", "string" },
        { "description", "The customer's phone number in E.164 format (e.g. +9771234567890)" }
    };
    p["required"] = json::array({ "phone_number" });
    json d;
    d["name"] = "lookup_account";
    d["description"] = "Look up a customer account by phone number. "
        "Returns the customer's name, account ID, and basic profile information. "
        "Use this when the caller asks about their account or needs to verify identity.";
    d["parameters"] = p;
    return d;
}

static json makeTransferToHuman() {
    json p;
    p["type"] = "object";
    p["properties"]["reason"] = {
        { "type", "string" },
        { "description", "Why the transfer is happening (e.g. 'caller_request', 'complex_issue', 'escalation')" }
    };
    p["properties"]["summary"] = {
        { "type", "string" },
        { "description", "Brief summary of the conversation so far for the human operator" }
    };
    p["required"] = json::array({ "reason" });
    json d;
    d["name"] = "transfer_to_human";
    d["description"] = "Transfer the current call to a human operator. "
        "Use this when the caller explicitly asks to speak with a human, "
        "when the issue is too complex to handle, "
        "or when the caller is frustrated and needs human assistance. "
        "Provide a reason and summary for the human operator.";
    d["parameters"] = p;
    return d;
}

static const json& declarations() {
    static const json decls = {
        { "lookup_account", makeLookupAccount() },
        { "transfer_to_human", makeTransferToHuman() }
    };
    return decls;
}

bool isKnownTool(const string& name) {
    return declarations().contains(name);
}

json toolDeclarations(const vector<string>& names) {
    json a = json::array();
    for (const string& name : names) {
        if (!isKnownTool(name))
            throw ConfigurationError("Unknown tool '" + name + "'");
        a.push_back(declarations()[name]);
    }
    return a;
}

    }
}
