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
#include <cstdlib>
#include <fstream>
#include <sstream>

#include "gwbridge/Errors.h"

#include "Config.h"

using namespace std;
using json = nlohmann::json;

namespace kc1fsz {
    namespace gwbridge {

const char* Config::API_KEY_ENV = "GWBRIDGE_UPSTREAM_API_KEY";

void Config::setDefaults() {
    listenHost = "0.0.0.0";
    listenPort = 8765;
    statusPort = 8766;
    maxSessions = 1000;
    acquireTimeoutMs = 5000;
    defaultModelId = "gemini-2.5-flash-native-audio-preview-12-2025";
    defaultVoice = "Kore";
    defaultSystemInstruction.clear();
    sessionTimeoutSec = 600;
    extendBufferSec = 60;
    toolNames = { "lookup_account", "transfer_to_human" };
    upstreamUrl = "wss://generativelanguage.googleapis.com/ws/"
        "google.ai.generativelanguage.v1beta.GenerativeService.BidiGenerateContent";
    upstreamApiKey.clear();
    connectTimeoutMs = 10000;
    gatewaySampleRate = 16000;
    upstreamInputRate = 16000;
    upstreamOutputRate = 24000;
    directoryFile.clear();
    interactionLogFile.clear();
    pendingDecisionTtlMs = 60000;
    piperDir.clear();
    ttsSampleRate = 16000;
    ttsCacheEntries = 200;
    logServiceName = "gwbridge";
    logEnv = "dev";
    logApiKey.clear();
}

json Config::toJson() const {
    json o;
    o["listenHost"] = listenHost;
    o["listenPort"] = listenPort;
    o["statusPort"] = statusPort;
    o["maxSessions"] = maxSessions;
    o["acquireTimeoutMs"] = acquireTimeoutMs;
    o["defaultModelId"] = defaultModelId;
    o["defaultVoice"] = defaultVoice;
    o["defaultSystemInstruction"] = defaultSystemInstruction;
    o["sessionTimeoutSec"] = sessionTimeoutSec;
    o["extendBufferSec"] = extendBufferSec;
    o["toolNames"] = toolNames;
    o["upstreamUrl"] = upstreamUrl;
    // Never echo secrets
    o["upstreamApiKey"] = upstreamApiKey.empty() ? "" : "********";
    o["connectTimeoutMs"] = connectTimeoutMs;
    o["gatewaySampleRate"] = gatewaySampleRate;
    o["upstreamInputRate"] = upstreamInputRate;
    o["upstreamOutputRate"] = upstreamOutputRate;
    o["directoryFile"] = directoryFile;
    o["interactionLogFile"] = interactionLogFile;
    o["pendingDecisionTtlMs"] = pendingDecisionTtlMs;
    o["piperDir"] = piperDir;
    o["ttsSampleRate"] = ttsSampleRate;
    o["ttsCacheEntries"] = ttsCacheEntries;
    o["logServiceName"] = logServiceName;
    o["logEnv"] = logEnv;
    o["logApiKey"] = logApiKey.empty() ? "" : "********";
    return o;
}

template<typename T> static void readKey(const json& j, const char* key, T& target) {
    if (!j.contains(key) || j[key].is_null())
        return;
    try {
        target = j[key].get<T>();
    } catch (const json::exception& ex) {
        throw ConfigurationError(string("Bad value for ") + key + ": " + ex.what());
    }
}

void Config::fromJson(const json& j) {

    if (!j.is_object())
        throw ConfigurationError("Configuration must be a JSON object");

    readKey(j, "listenHost", listenHost);
    readKey(j, "listenPort", listenPort);
    readKey(j, "statusPort", statusPort);
    readKey(j, "maxSessions", maxSessions);
    readKey(j, "acquireTimeoutMs", acquireTimeoutMs);
    readKey(j, "defaultModelId", defaultModelId);
    readKey(j, "defaultVoice", defaultVoice);
    readKey(j, "defaultSystemInstruction", defaultSystemInstruction);
    readKey(j, "sessionTimeoutSec", sessionTimeoutSec);
    readKey(j, "extendBufferSec", extendBufferSec);
    readKey(j, "toolNames", toolNames);
    readKey(j, "upstreamUrl", upstreamUrl);
    readKey(j, "upstreamApiKey", upstreamApiKey);
    readKey(j, "connectTimeoutMs", connectTimeoutMs);
    readKey(j, "gatewaySampleRate", gatewaySampleRate);
    readKey(j, "upstreamInputRate", upstreamInputRate);
    readKey(j, "upstreamOutputRate", upstreamOutputRate);
    readKey(j, "directoryFile", directoryFile);
    readKey(j, "interactionLogFile", interactionLogFile);
    readKey(j, "pendingDecisionTtlMs", pendingDecisionTtlMs);
    readKey(j, "piperDir", piperDir);
    readKey(j, "ttsSampleRate", ttsSampleRate);
    readKey(j, "ttsCacheEntries", ttsCacheEntries);
    readKey(j, "logServiceName", logServiceName);
    readKey(j, "logEnv", logEnv);
    readKey(j, "logApiKey", logApiKey);

    if (maxSessions == 0)
        throw ConfigurationError("maxSessions must be at least 1");
    if (listenPort == 0 || listenPort > 65535)
        throw ConfigurationError("listenPort is out of range");
    if (statusPort > 65535)
        throw ConfigurationError("statusPort is out of range");
    if (gatewaySampleRate == 0 || upstreamInputRate == 0 || upstreamOutputRate == 0 ||
        ttsSampleRate == 0)
        throw ConfigurationError("Sample rates must be positive");
}

void Config::applyEnvironment() {
    const char* key = getenv(API_KEY_ENV);
    if (key != 0 && key[0] != 0)
        upstreamApiKey = key;
}

Config Config::load(const string& fileName) {
    ifstream f(fileName);
    if (!f.good())
        throw ConfigurationError("Unable to open " + fileName);
    std::stringstream buffer;
    buffer << f.rdbuf();
    json j;
    try {
        j = json::parse(buffer.str());
    } catch (const json::exception& ex) {
        throw ConfigurationError("Invalid format in " + fileName + ": " + ex.what());
    }
    Config cfg;
    cfg.fromJson(j);
    cfg.applyEnvironment();
    return cfg;
}

    }
}
