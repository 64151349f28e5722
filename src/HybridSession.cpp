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
#include "kc1fsz-tools/Log.h"

#include "gwbridge/Errors.h"

#include "HybridSession.h"

using namespace std;

namespace kc1fsz {
    namespace gwbridge {

HybridSession::HybridSession(Log& log, shared_ptr<Session> inner, const SessionConfig& cfg,
    TtsEngine& tts, TtsCache* cache)
:   _log(log),
    _inner(inner),
    _tts(tts),
    _cache(cache) {
    if (cfg.outputMode != OutputMode::HYBRID)
        throw ConfigurationError("Hybrid session requires output mode hybrid");
    _ttsConfig.provider = cfg.ttsProvider;
    _ttsConfig.voice = cfg.ttsVoice;
}

SessionInfo HybridSession::info() const {
    SessionInfo i = _inner->info();
    i.outputMode = outputModeName(OutputMode::HYBRID);
    return i;
}

bool HybridSession::receive(AgentResponse& out, unsigned timeoutMs) {
    if (!_inner->receive(out, timeoutMs))
        return false;
    if (out.hasText() && !out.hasAudio())
        _synthesize(out);
    return true;
}

void HybridSession::_synthesize(AgentResponse& r) {

    const string key = _ttsConfig.provider + "|" + _ttsConfig.voice + "|" + r.text;

    TtsAudio audio;
    if (!_cache || !_cache->get(key, audio)) {
        try {
            audio.rate = _tts.synthesize(r.text, _ttsConfig, audio.pcm);
        }
        catch (const exception& ex) {
            // The text still goes out
            _synthFailures++;
            _log.error("Session %s synthesis failed: %s", id().c_str(), ex.what());
            return;
        }
        if (_cache)
            _cache->put(key, audio);
    }

    r.audio = std::move(audio.pcm);
    r.audioRate = audio.rate;
    if (r.outputTranscript.empty())
        r.outputTranscript = r.text;
}

    }
}
