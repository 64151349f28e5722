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

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace kc1fsz {
    namespace gwbridge {

/**
 * Everything that can be set in the service configuration file.
 */
class Config {
public:

    static const char* API_KEY_ENV;

    Config() { setDefaults(); }

    // Device WebSocket endpoint
    std::string listenHost;
    unsigned listenPort = 0;
    // 0 disables the status server
    unsigned statusPort = 0;

    unsigned maxSessions = 0;
    unsigned acquireTimeoutMs = 0;
    std::string defaultModelId;
    std::string defaultVoice;
    std::string defaultSystemInstruction;
    unsigned sessionTimeoutSec = 0;
    unsigned extendBufferSec = 0;
    std::vector<std::string> toolNames;

    std::string upstreamUrl;
    std::string upstreamApiKey;
    unsigned connectTimeoutMs = 0;

    unsigned gatewaySampleRate = 0;
    unsigned upstreamInputRate = 0;
    unsigned upstreamOutputRate = 0;

    std::string directoryFile;
    std::string interactionLogFile;
    uint32_t pendingDecisionTtlMs = 0;

    std::string piperDir;
    unsigned ttsSampleRate = 0;
    unsigned ttsCacheEntries = 0;

    std::string logServiceName;
    std::string logEnv;
    std::string logApiKey;

    void setDefaults();

    nlohmann::json toJson() const;

    /**
     * Keys that are missing keep their current values.
     *
     * @throws ConfigurationError if a key has the wrong type or a value
     * is out of range.
     */
    void fromJson(const nlohmann::json& j);

    /**
     * Applies overrides from the process environment.
     */
    void applyEnvironment();

    /**
     * Reads a configuration file on top of the defaults.
     *
     * @throws ConfigurationError
     */
    static Config load(const std::string& fileName);
};

    }
}
