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

namespace kc1fsz {
    namespace gwbridge {

struct TtsConfig {
    // Which engine (used by the router)
    std::string provider;
    // Engine-specific voice/model name. Empty means the engine default.
    std::string voice;
};

/**
 * The abstract interface to a text-to-speech engine.
 */
class TtsEngine {
public:

    virtual ~TtsEngine() { }

    /**
     * Blocking.
     *
     * @param pcmOut Receives PCM16 LE mono. Anything already in the vector
     * is discarded.
     * @returns The sample rate of the audio produced.
     * @throws TtsError on failure.
     */
    virtual unsigned synthesize(const std::string& text, const TtsConfig& cfg,
        std::vector<uint8_t>& pcmOut) = 0;
};

    }
}
