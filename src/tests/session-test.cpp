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
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

#include "kc1fsz-tools/Log.h"

#include "gwbridge/Errors.h"

#include "LiveSession.h"
#include "HybridSession.h"
#include "TestUtil.h"

using namespace std;
using namespace kc1fsz;
using namespace kc1fsz::gwbridge;

static SessionConfig makeConfig() {
    SessionConfig cfg;
    return cfg.withDefaults(SessionConfig());
}

static void sleepMs(unsigned ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

static void lifecycleTest() {
    Log log;
    auto up = make_shared<FakeUpstream>();
    LiveSession s(log, makeConfig(), up->factory());
    assert(s.id().size() == 32);
    assert(s.state() == SessionState::CONNECTING);

    // Nothing is legal before start()
    vector<uint8_t> pcm = makePcm(320);
    bool thrown = false;
    try {
        s.sendAudio(pcm.data(), pcm.size());
    } catch (const SessionLifecycleError&) {
        thrown = true;
    }
    assert(thrown);

    s.start();
    assert(s.state() == SessionState::ACTIVE);
    assert(up->connectCount() == 1);
    assert(up->connectTokens()[0] == "");

    // Can't start twice
    thrown = false;
    try {
        s.start();
    } catch (const SessionLifecycleError&) {
        thrown = true;
    }
    assert(thrown);

    s.sendAudio(pcm.data(), pcm.size());
    s.sendAudio(pcm.data(), 160);
    s.sendAudioEnd();
    s.sendText("Hello");
    assert(up->audioSentSizes().size() == 2);
    assert(up->audioEndCount() == 1);
    assert(up->textsSent()[0] == "Hello");

    SessionInfo info = s.info();
    assert(info.metrics.chunksSent == 2);
    assert(info.metrics.bytesSent == 480);
    assert(info.hasResumptionToken);
    assert(info.voiceName == "Kore");
    assert(info.outputMode == "native_audio");

    s.teardown();
    assert(s.state() == SessionState::CLOSED);
    assert(up->closeCount() == 1);
    // Twice is fine
    s.teardown();
    assert(up->closeCount() == 1);

    thrown = false;
    try {
        s.sendText("Late");
    } catch (const SessionLifecycleError&) {
        thrown = true;
    }
    assert(thrown);
}

static void startFailureTest() {
    Log log;
    auto up = make_shared<FakeUpstream>();
    up->setFailConnect(true);
    LiveSession s(log, makeConfig(), up->factory());
    bool thrown = false;
    try {
        s.start();
    } catch (const SessionLifecycleError& ex) {
        thrown = true;
        assert(ex.sessionId() == s.id());
    }
    assert(thrown);
    assert(s.state() == SessionState::ERROR);
    s.teardown();
    assert(s.state() == SessionState::CLOSED);

    // A bad voice is caught before anything is connected
    auto up2 = make_shared<FakeUpstream>();
    SessionConfig cfg = makeConfig();
    cfg.voiceName = "Nobody";
    LiveSession s2(log, cfg, up2->factory());
    thrown = false;
    try {
        s2.start();
    } catch (const ConfigurationError&) {
        thrown = true;
    }
    assert(thrown);
    assert(up2->connectCount() == 0);
}

static void receiveTest() {
    Log log;
    auto up = make_shared<FakeUpstream>();
    LiveSession s(log, makeConfig(), up->factory());
    s.start();

    AgentResponse r;
    assert(!s.receive(r, 0));

    assert(up->pushAudio(480));
    AgentResponse t;
    t.outputTranscript = "Hi there";
    t.turnComplete = true;
    assert(up->push(t));

    assert(s.receive(r, 100));
    assert(r.audio.size() == 480);
    assert(r.audioRate == 24000);
    r = AgentResponse();
    assert(s.receive(r, 100));
    assert(!r.hasAudio());
    assert(r.outputTranscript == "Hi there");
    assert(r.turnComplete);

    // Only audio counts as a received chunk
    SessionInfo info = s.info();
    assert(info.metrics.chunksReceived == 1);
    assert(info.metrics.bytesReceived == 480);
}

static void upstreamCloseTest() {
    Log log;
    auto up = make_shared<FakeUpstream>();
    LiveSession s(log, makeConfig(), up->factory());
    s.start();
    up->pushAudio(100);
    up->remoteClose();

    // What already arrived is still delivered
    AgentResponse r;
    assert(s.receive(r, 0));
    bool thrown = false;
    try {
        s.receive(r, 10);
    } catch (const SessionLifecycleError&) {
        thrown = true;
    }
    assert(thrown);
    assert(s.state() == SessionState::ERROR);
}

static void sendFailureTest() {
    Log log;
    auto up = make_shared<FakeUpstream>();
    LiveSession s(log, makeConfig(), up->factory());
    s.start();
    up->setFailSends(true);
    bool thrown = false;
    try {
        s.sendText("x");
    } catch (const SessionLifecycleError&) {
        thrown = true;
    }
    assert(thrown);
    assert(s.state() == SessionState::ERROR);
}

static void extendTest() {
    Log log;
    auto up = make_shared<FakeUpstream>();
    LiveSession s(log, makeConfig(), up->factory());
    s.start();

    // Left on the old connection when the swap happens
    up->pushAudio(100);
    up->pushAudio(200);
    up->setIssuedToken("token-2");

    s.extend();
    assert(s.state() == SessionState::ACTIVE);
    assert(up->connectCount() == 2);
    assert(up->connectTokens()[1] == "token-1");
    assert(up->closeCount() == 1);
    assert(up->liveCount() == 1);
    assert(s.info().metrics.extensions == 1);

    up->pushAudio(300);
    AgentResponse r;
    assert(s.receive(r, 0) && r.audio.size() == 100);
    assert(s.receive(r, 0) && r.audio.size() == 200);
    assert(s.receive(r, 100) && r.audio.size() == 300);

    // The next hop uses the newest token
    s.extend();
    assert(up->connectTokens()[2] == "token-2");
    assert(s.info().metrics.extensions == 2);
}

static void extendWithoutTokenTest() {
    Log log;
    auto up = make_shared<FakeUpstream>();
    up->setIssuedToken("");
    LiveSession s(log, makeConfig(), up->factory());
    s.start();
    bool thrown = false;
    try {
        s.extend();
    } catch (const SessionTimeoutError&) {
        assert(false);
    } catch (const SessionLifecycleError&) {
        thrown = true;
    }
    assert(thrown);
    // Left alone
    assert(s.state() == SessionState::ACTIVE);
    assert(up->connectCount() == 1);
}

static void extendFailureTest() {
    Log log;
    auto up = make_shared<FakeUpstream>();
    LiveSession s(log, makeConfig(), up->factory());
    s.start();
    up->setFailConnect(true);
    bool thrown = false;
    try {
        s.extend();
    } catch (const SessionTimeoutError&) {
        thrown = true;
    }
    assert(thrown);
    assert(s.state() == SessionState::ERROR);

    // The session is finished
    thrown = false;
    vector<uint8_t> pcm = makePcm(32);
    try {
        s.sendAudio(pcm.data(), pcm.size());
    } catch (const SessionTimeoutError&) {
        thrown = true;
    }
    assert(thrown);
}

static void queuedSendTest() {
    Log log;
    auto up = make_shared<FakeUpstream>();
    LiveSession s(log, makeConfig(), up->factory());
    s.start();
    up->setConnectDelayMs(300);

    std::thread t([&s]() { s.extend(); });
    sleepMs(100);
    assert(s.state() == SessionState::EXTENDING);

    // Held until the new connection is up
    vector<uint8_t> pcm = makePcm(64);
    s.sendAudio(pcm.data(), pcm.size());
    s.sendText("During");
    assert(up->audioSentSizes().empty());
    assert(up->textsSent().empty());

    t.join();
    assert(s.state() == SessionState::ACTIVE);
    assert(up->audioSentSizes().size() == 1);
    assert(up->audioSentSizes()[0] == 64);
    assert(up->textsSent()[0] == "During");
}

static void autoExtendTest() {
    Log log;
    auto up = make_shared<FakeUpstream>();

    SessionConfig cfg = makeConfig();
    assert(LiveSession(log, cfg, up->factory(), 60).extensionDelayMs() == 540000);
    cfg.timeoutSec = 30;
    // Buffer bigger than the timeout
    assert(LiveSession(log, cfg, up->factory(), 60).extensionDelayMs() == 30000);

    cfg.timeoutSec = 1;
    LiveSession s(log, cfg, up->factory(), 60);
    s.start();
    sleepMs(1500);
    assert(up->connectCount() == 2);
    assert(s.info().metrics.extensions == 1);
    assert(s.state() == SessionState::ACTIVE);

    // Teardown cancels the timer
    s.teardown();
    sleepMs(1200);
    assert(up->connectCount() == 2);
}

static void teardownRaceTest() {
    Log log;
    auto up = make_shared<FakeUpstream>();

    {
        LiveSession s(log, makeConfig(), up->factory());
        s.start();
        assert(s.isExtensionScheduled());
        s.extend();
        assert(s.isExtensionScheduled());
        s.teardown();
        assert(!s.isExtensionScheduled());
    }

    // However the two interleave, a closed session has no timer armed
    for (unsigned i = 0; i < 200; i++) {
        LiveSession s(log, makeConfig(), up->factory());
        s.start();
        thread extender([&s]() {
            try {
                s.extend();
            } catch (const SessionLifecycleError&) {
                // Teardown got there first
            }
        });
        s.teardown();
        extender.join();
        assert(s.state() == SessionState::CLOSED);
        assert(!s.isExtensionScheduled());
    }

    // Torn down while the new connection is being made
    up->setConnectDelayMs(200);
    LiveSession s(log, makeConfig(), up->factory());
    s.start();
    unsigned connects = up->connectCount();
    thread extender([&s]() { s.extend(); });
    sleepMs(50);
    s.teardown();
    extender.join();
    assert(!s.isExtensionScheduled());
    assert(up->connectCount() == connects + 1);
}

static void autoExtendFailureTest() {
    Log log;
    auto up = make_shared<FakeUpstream>();
    up->setIssuedToken("");
    SessionConfig cfg = makeConfig();
    cfg.timeoutSec = 1;
    LiveSession s(log, cfg, up->factory(), 60);
    s.start();
    sleepMs(1500);
    // No token means no way forward
    assert(s.state() == SessionState::ERROR);
    AgentResponse r;
    bool thrown = false;
    try {
        s.receive(r, 0);
    } catch (const SessionTimeoutError&) {
        thrown = true;
    }
    assert(thrown);
}

static void hybridTest() {
    Log log;
    TestClock clock(log);
    auto up = make_shared<FakeUpstream>();
    FakeTts tts;
    LruEviction<string> policy(10);
    TtsCache cache(clock, &policy);

    SessionConfig cfg = makeConfig();
    cfg.outputMode = OutputMode::HYBRID;
    cfg.ttsVoice = "en_US-amy-low";

    // Must be hybrid
    bool thrown = false;
    try {
        HybridSession h(log, make_shared<LiveSession>(log, makeConfig(), up->factory()),
            makeConfig(), tts, &cache);
    } catch (const ConfigurationError&) {
        thrown = true;
    }
    assert(thrown);

    HybridSession h(log, make_shared<LiveSession>(log, cfg, up->factory()), cfg, tts, &cache);
    h.start();
    assert(h.state() == SessionState::ACTIVE);
    assert(h.info().outputMode == "hybrid");

    up->pushText("Hello", true);
    AgentResponse r;
    assert(h.receive(r, 100));
    assert(r.text == "Hello");
    assert(r.audio.size() == 1000);
    assert(r.audioRate == 16000);
    assert(r.outputTranscript == "Hello");
    assert(r.turnComplete);
    assert(tts.calls == 1);
    assert(tts.lastVoice == "en_US-amy-low");

    // Cached
    up->pushText("Hello");
    r = AgentResponse();
    assert(h.receive(r, 100));
    assert(r.audio.size() == 1000);
    assert(tts.calls == 1);

    // Audio from upstream is passed through
    up->pushAudio(480);
    r = AgentResponse();
    assert(h.receive(r, 100));
    assert(r.audio.size() == 480);
    assert(tts.calls == 1);

    // A failure still delivers the text
    tts.fail = true;
    up->pushText("Goodbye");
    r = AgentResponse();
    assert(h.receive(r, 100));
    assert(r.text == "Goodbye");
    assert(!r.hasAudio());
    assert(h.synthesisFailures() == 1);

    h.teardown();
    assert(h.state() == SessionState::CLOSED);
}

int main(int, const char**) {
    lifecycleTest();
    startFailureTest();
    receiveTest();
    upstreamCloseTest();
    sendFailureTest();
    extendTest();
    extendWithoutTokenTest();
    extendFailureTest();
    queuedSendTest();
    autoExtendTest();
    autoExtendFailureTest();
    teardownRaceTest();
    hybridTest();
    cout << "session-test OK" << endl;
    return 0;
}
