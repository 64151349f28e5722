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
#include <random>
#include <mutex>
#include <cstdio>

#include "gwbridge/Errors.h"
#include "gwbridge/SessionConfig.h"

#include "Catalog.h"

using namespace std;

namespace kc1fsz {
    namespace gwbridge {

const char* SessionConfig::DEFAULT_MODEL_ID = "gemini-2.5-flash-native-audio-preview-12-2025";
const char* SessionConfig::DEFAULT_VOICE = "Kore";

const char* outputModeName(OutputMode m) {
    switch (m) {
        case OutputMode::NATIVE_AUDIO: return "native_audio";
        case OutputMode::HYBRID: return "hybrid";
    }
    return "";
}

SessionConfig SessionConfig::withDefaults(const SessionConfig& defaults) const {
    SessionConfig r = *this;
    if (r.sessionId.empty())
        r.sessionId = makeSessionId();
    if (r.modelId.empty())
        r.modelId = defaults.modelId.empty() ? DEFAULT_MODEL_ID : defaults.modelId;
    if (r.voiceName.empty())
        r.voiceName = defaults.voiceName.empty() ? DEFAULT_VOICE : defaults.voiceName;
    if (r.systemInstruction.empty())
        r.systemInstruction = defaults.systemInstruction;
    if (r.toolNames.empty())
        r.toolNames = defaults.toolNames;
    if (r.ttsVoice.empty())
        r.ttsVoice = defaults.ttsVoice;
    return r;
}

void SessionConfig::validate() const {
    if (!voiceName.empty() && !isKnownVoice(voiceName))
        throw ConfigurationError("Invalid voice '" + voiceName + "'");
    for (const string& t : toolNames)
        if (!isKnownTool(t))
            throw ConfigurationError("Unknown tool '" + t + "'");
}

string makeSessionId() {
    static mutex lock;
    static mt19937_64 gen(random_device{}());
    uint64_t a, b;
    {
        lock_guard<mutex> guard(lock);
        a = gen();
        b = gen();
    }
    char buf[33];
    snprintf(buf, sizeof(buf), "%016llx%016llx", (unsigned long long)a, (unsigned long long)b);
    return string(buf);
}

    }
}
