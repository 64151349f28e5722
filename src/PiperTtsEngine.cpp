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

#include <piper.h>

#include "kc1fsz-tools/Log.h"
#include "kc1fsz-tools/Common.h"

#include "gwbridge/Errors.h"

#include "PiperTtsEngine.h"

using namespace std;

namespace kc1fsz {
    namespace gwbridge {

const char* PiperTtsEngine::DEFAULT_VOICE = "en_US-amy-low";

PiperTtsEngine::PiperTtsEngine(Log& log, const string& piperDir, unsigned sampleRate)
:   _log(log),
    _dir(piperDir),
    _sampleRate(sampleRate) {
}

PiperTtsEngine::~PiperTtsEngine() {
    for (auto& [voice, synth] : _synths)
        piper_free(synth);
}

piper_synthesizer* PiperTtsEngine::_getSynth(const string& voice) {
    auto it = _synths.find(voice);
    if (it != _synths.end())
        return it->second;
    string model = _dir + "/" + voice + ".onnx";
    string modelConfig = model + ".json";
    string espeak = _dir + "/espeak-ng-data";
    piper_synthesizer* synth = piper_create(model.c_str(), modelConfig.c_str(), espeak.c_str());
    if (synth == 0)
        throw TtsError("Failed to load piper voice " + voice);
    _log.info("Loaded piper voice %s", voice.c_str());
    _synths[voice] = synth;
    return synth;
}

unsigned PiperTtsEngine::synthesize(const string& text, const TtsConfig& cfg,
    vector<uint8_t>& pcmOut) {

    pcmOut.clear();
    if (text.empty())
        return _sampleRate;

    lock_guard<mutex> lock(_lock);

    piper_synthesizer* synth = _getSynth(cfg.voice.empty() ? DEFAULT_VOICE : cfg.voice);
    piper_synthesize_options options = piper_default_synthesize_options(synth);

    if (piper_synthesize_start(synth, text.c_str(), &options) != PIPER_OK)
        throw TtsError("Unable to start synthesis");

    // Samples are float32, converted to 16-bit LE
    piper_audio_chunk chunk;
    uint8_t buf[2];
    unsigned rate = _sampleRate;
    while (true) {
        int rc = piper_synthesize_next(synth, &chunk);
        if (rc != PIPER_OK && rc != PIPER_DONE)
            throw TtsError("Synthesis failed");
        if (chunk.sample_rate > 0)
            rate = chunk.sample_rate;
        for (unsigned i = 0; i < chunk.num_samples; i++) {
            float s = std::clamp(chunk.samples[i], -1.0f, 1.0f);
            pack_int16_le((int16_t)(32767.0f * s), buf);
            pcmOut.push_back(buf[0]);
            pcmOut.push_back(buf[1]);
        }
        if (rc == PIPER_DONE)
            break;
    }

    return rate;
}

    }
}
