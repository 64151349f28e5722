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

namespace kc1fsz {
    namespace gwbridge {

enum class OutputMode {
    // The upstream produces audio directly
    NATIVE_AUDIO,
    // The upstream produces text, audio is made locally by TTS
    HYBRID
};

const char* outputModeName(OutputMode m);

/**
 * Construction parameters for one upstream session. Treated as a value:
 * anything that needs different settings makes a copy.
 */
class SessionConfig {
public:

    static const char* DEFAULT_MODEL_ID;
    static const char* DEFAULT_VOICE;
    static const unsigned DEFAULT_TIMEOUT_SEC = 600;

    // Empty means "generate one"
    std::string sessionId;
    // Empty means "use the pool default"
    std::string modelId;
    // Empty means "use the pool default"
    std::string voiceName;
    // Empty means "use the pool default"
    std::string systemInstruction;
    unsigned timeoutSec = DEFAULT_TIMEOUT_SEC;
    bool inputTranscription = true;
    bool outputTranscription = true;
    float temperature = 0.7f;
    OutputMode outputMode = OutputMode::NATIVE_AUDIO;
    std::vector<std::string> toolNames;
    std::string ttsProvider = "piper";
    std::string ttsVoice;

    /**
     * @returns A config with every empty field filled in from the
     * defaults provided. This object is not modified.
     */
    SessionConfig withDefaults(const SessionConfig& defaults) const;

    /**
     * Checks the voice and tool names against the catalogs.
     *
     * @throws ConfigurationError
     */
    void validate() const;
};

/**
 * @returns A random 32-character hex identifier.
 */
std::string makeSessionId();

    }
}
