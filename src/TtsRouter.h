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

#include <map>
#include <mutex>
#include <string>

#include "gwbridge/TtsEngine.h"

namespace kc1fsz {

class Log;

    namespace gwbridge {

/**
 * Dispatches synthesis requests to an engine selected by provider name,
 * with an optional fallback engine for unknown providers.
 */
class TtsRouter : public TtsEngine {
public:

    TtsRouter(Log& log);

    /**
     * @param engine Not owned.
     */
    void registerEngine(const std::string& provider, TtsEngine* engine);

    /**
     * The provider used when the requested one isn't registered.
     */
    void setFallback(const std::string& provider);

    bool hasProvider(const std::string& provider);

    // ----- TtsEngine --------------------------------------------------------

    unsigned synthesize(const std::string& text, const TtsConfig& cfg,
        std::vector<uint8_t>& pcmOut);

private:

    Log& _log;
    std::mutex _lock;
    std::map<std::string, TtsEngine*> _engines;
    std::string _fallback;
};

    }
}
