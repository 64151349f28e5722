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

struct piper_synthesizer;

namespace kc1fsz {

class Log;

    namespace gwbridge {

/**
 * Local speech synthesis using piper. Each voice is a model file pair
 * (<voice>.onnx and <voice>.onnx.json) in the piper directory, loaded
 * the first time it is used.
 *
 * Synthesis is serialized.
 */
class PiperTtsEngine : public TtsEngine {
public:

    static const char* DEFAULT_VOICE;

    /**
     * @param piperDir Holds the voice models and espeak-ng-data.
     * @param sampleRate Assumed when a model does not report its rate.
     */
    PiperTtsEngine(Log& log, const std::string& piperDir, unsigned sampleRate);
    ~PiperTtsEngine();

    // ----- TtsEngine --------------------------------------------------------

    unsigned synthesize(const std::string& text, const TtsConfig& cfg,
        std::vector<uint8_t>& pcmOut);

private:

    piper_synthesizer* _getSynth(const std::string& voice);

    Log& _log;
    const std::string _dir;
    const unsigned _sampleRate;
    std::mutex _lock;
    std::map<std::string, piper_synthesizer*> _synths;
};

    }
}
