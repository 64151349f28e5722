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

#include <atomic>
#include <memory>
#include <string>

#include "gwbridge/Session.h"
#include "gwbridge/SessionConfig.h"
#include "gwbridge/TtsEngine.h"
#include "gwbridge/KeyValueStore.h"

namespace kc1fsz {

class Log;

    namespace gwbridge {

/**
 * Synthesized audio, as kept in the TTS cache.
 */
struct TtsAudio {
    std::vector<uint8_t> pcm;
    unsigned rate = 0;
};

typedef KeyValueStore<std::string, TtsAudio> TtsCache;

/**
 * Wraps a session whose upstream produces text instead of audio. Any
 * response that carries text but no audio gets audio attached by the
 * local TTS engine. If synthesis fails the text-only response is still
 * passed along so the caller can decide what to do.
 *
 * Everything else is delegated to the inner session unchanged.
 */
class HybridSession : public Session {
public:

    /**
     * @param inner The text-mode session, shared with nobody else.
     * @param tts Not owned.
     * @param cache Optional, not owned.
     * @throws ConfigurationError if the config is not in HYBRID mode.
     */
    HybridSession(Log& log, std::shared_ptr<Session> inner, const SessionConfig& cfg,
        TtsEngine& tts, TtsCache* cache = nullptr);

    unsigned synthesisFailures() const { return _synthFailures; }

    // ----- Session ----------------------------------------------------------

    const std::string& id() const { return _inner->id(); }
    SessionState state() const { return _inner->state(); }
    SessionInfo info() const;
    void start() { _inner->start(); }
    void sendAudio(const uint8_t* data, unsigned len) { _inner->sendAudio(data, len); }
    void sendAudioEnd() { _inner->sendAudioEnd(); }
    void sendText(const std::string& text) { _inner->sendText(text); }
    void sendToolResponse(const std::vector<ToolResult>& results) { _inner->sendToolResponse(results); }
    bool receive(AgentResponse& out, unsigned timeoutMs);
    void extend() { _inner->extend(); }
    void teardown() { _inner->teardown(); }

private:

    void _synthesize(AgentResponse& r);

    Log& _log;
    std::shared_ptr<Session> _inner;
    TtsConfig _ttsConfig;
    TtsEngine& _tts;
    TtsCache* _cache;
    std::atomic<unsigned> _synthFailures = 0;
};

    }
}
