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

#include "TtsRouter.h"

using namespace std;

namespace kc1fsz {
    namespace gwbridge {

TtsRouter::TtsRouter(Log& log)
:   _log(log) {
}

void TtsRouter::registerEngine(const string& provider, TtsEngine* engine) {
    lock_guard<mutex> guard(_lock);
    _engines[provider] = engine;
    _log.info("TTS provider registered: %s", provider.c_str());
}

void TtsRouter::setFallback(const string& provider) {
    lock_guard<mutex> guard(_lock);
    _fallback = provider;
}

bool TtsRouter::hasProvider(const string& provider) {
    lock_guard<mutex> guard(_lock);
    return _engines.find(provider) != _engines.end();
}

unsigned TtsRouter::synthesize(const string& text, const TtsConfig& cfg,
    vector<uint8_t>& pcmOut) {

    TtsEngine* engine = nullptr;
    {
        lock_guard<mutex> guard(_lock);
        auto it = _engines.find(cfg.provider);
        if (it == _engines.end() && !_fallback.empty()) {
            _log.info("TTS provider %s unavailable, using %s", cfg.provider.c_str(),
                _fallback.c_str());
            it = _engines.find(_fallback);
        }
        if (it == _engines.end())
            throw TtsError("Provider unavailable: " + cfg.provider);
        engine = it->second;
    }

    // Engines do their own locking
    return engine->synthesize(text, cfg, pcmOut);
}

    }
}
