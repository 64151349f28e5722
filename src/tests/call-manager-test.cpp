#include <cassert>
#include <atomic>
#include <iostream>
#include <thread>

#include "kc1fsz-tools/Log.h"

#include "gwbridge/Errors.h"

#include "SessionPool.h"
#include "CallManager.h"
#include "StatusServer.h"
#include "TestUtil.h"

using namespace std;
using namespace kc1fsz;
using namespace kc1fsz::gwbridge;

static void basicTest() {
    Log log;
    auto up = make_shared<FakeUpstream>();
    SessionPool pool(log, makeSessionFactory(log, up->factory(), 60, nullptr, nullptr),
        4, SessionConfig());
    CallManager calls(log, pool, 100);

    CallRecord rec = calls.createSession("call-1", "gw-1", "+15551234567");
    assert(rec.callId == "call-1");
    assert(rec.gatewayId == "gw-1");
    assert(rec.callerNumber == "+15551234567");
    assert(rec.session);
    assert(rec.startedAt > 0);
    assert(calls.getSession("call-1") == rec.session);
    assert(calls.activeCallCount() == 1);
    assert(pool.activeCount() == 1);

    CallRecord copy;
    assert(calls.getRecord("call-1", copy));
    assert(copy.session == rec.session);
    assert(!calls.getRecord("call-2", copy));
    assert(calls.getSession("call-2") == nullptr);

    // One session per call
    bool thrown = false;
    try {
        calls.createSession("call-1", "gw-1", "+15551234567");
    } catch (const DuplicateCallError&) {
        thrown = true;
    }
    assert(thrown);
    assert(pool.activeCount() == 1);

    calls.endSession("call-1");
    assert(calls.activeCallCount() == 0);
    assert(calls.getSession("call-1") == nullptr);
    assert(pool.activeCount() == 0);
    assert(rec.session->state() == SessionState::CLOSED);

    // Idempotent
    calls.endSession("call-1");
    calls.endSession("never-was");
    assert(pool.availableSlots() == 4);

    // The id can be used again once it is free
    calls.createSession("call-1", "gw-1", "+15551234567");
    assert(calls.activeCallCount() == 1);
    calls.teardownAll();
    assert(calls.activeCallCount() == 0);
    assert(pool.activeCount() == 0);
}

static void overrideTest() {
    Log log;
    auto up = make_shared<FakeUpstream>();
    SessionPool pool(log, makeSessionFactory(log, up->factory(), 60, nullptr, nullptr),
        4, SessionConfig());
    CallManager calls(log, pool, 100);
    SessionConfig cfg;
    cfg.voiceName = "Charon";
    cfg.systemInstruction = "You are a receptionist.";
    calls.createSession("call-9", "gw-1", "+15550000000", &cfg);
    assert(up->lastConfig().voiceName == "Charon");
    assert(up->lastConfig().systemInstruction == "You are a receptionist.");
    calls.teardownAll();
}

static void failureTest() {
    Log log;
    auto up = make_shared<FakeUpstream>();
    SessionPool pool(log, makeSessionFactory(log, up->factory(), 60, nullptr, nullptr),
        1, SessionConfig());
    CallManager calls(log, pool, 100);

    calls.createSession("a", "gw", "1");
    // Pool is full
    bool thrown = false;
    try {
        calls.createSession("b", "gw", "2");
    } catch (const AdmissionExhausted&) {
        thrown = true;
    }
    assert(thrown);
    // Nothing was left reserved
    assert(calls.getSession("b") == nullptr);
    calls.endSession("a");
    calls.createSession("b", "gw", "2");
    calls.endSession("b");

    // Connect failure
    up->setFailConnect(true);
    thrown = false;
    try {
        calls.createSession("c", "gw", "3");
    } catch (const SessionLifecycleError&) {
        thrown = true;
    }
    assert(thrown);
    assert(calls.activeCallCount() == 0);
    assert(pool.availableSlots() == 1);
}

static void raceTest() {
    Log log;
    auto up = make_shared<FakeUpstream>();
    // Slow connects widen the window
    up->setConnectDelayMs(100);
    SessionPool pool(log, makeSessionFactory(log, up->factory(), 60, nullptr, nullptr),
        10, SessionConfig());
    CallManager calls(log, pool, 1000);

    std::atomic<unsigned> created(0), duplicates(0);
    vector<thread> threads;
    for (unsigned t = 0; t < 4; t++)
        threads.push_back(thread([&calls, &created, &duplicates]() {
            try {
                calls.createSession("same-call", "gw", "1");
                created++;
            } catch (const DuplicateCallError&) {
                duplicates++;
            }
        }));
    for (auto& th : threads)
        th.join();
    assert(created == 1);
    assert(duplicates == 3);
    assert(pool.activeCount() == 1);
    calls.endSession("same-call");
    assert(pool.activeCount() == 0);
}

static void statusTest() {
    Log log;
    auto up = make_shared<FakeUpstream>();
    SessionPool pool(log, makeSessionFactory(log, up->factory(), 60, nullptr, nullptr),
        3, SessionConfig());
    CallManager calls(log, pool, 100);
    CallRecord rec = calls.createSession("call-1", "gw-1", "+1555");
    vector<uint8_t> pcm = makePcm(320);
    rec.session->sendAudio(pcm.data(), pcm.size());

    nlohmann::json o = StatusServer::makeStatus(pool, calls);
    assert(o["active_sessions"] == 1);
    assert(o["available_slots"] == 2);
    assert(o["max_sessions"] == 3);
    assert(o["active_calls"] == 1);
    assert(o["sessions"].size() == 1);
    assert(o["sessions"][0]["session_id"] == rec.session->id());
    assert(o["sessions"][0]["state"] == "active");
    assert(o["sessions"][0]["bytes_sent"] == 320);
    calls.teardownAll();

    o = StatusServer::makeStatus(pool, calls);
    assert(o["active_sessions"] == 0);
    assert(o["sessions"].empty());
}

int main(int, const char**) {
    basicTest();
    overrideTest();
    failureTest();
    raceTest();
    statusTest();
    cout << "call-manager-test OK" << endl;
    return 0;
}
