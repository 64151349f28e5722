#include <cassert>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "kc1fsz-tools/Log.h"

#include "gwbridge/KeyValueStore.h"

#include "TestUtil.h"

using namespace std;
using namespace kc1fsz;
using namespace kc1fsz::gwbridge;

static void basicTest() {
    Log log;
    TestClock clock(log);
    KeyValueStore<string, int> store(clock);
    int v = 0;
    assert(!store.get("a", v));
    store.put("a", 1);
    store.put("b", 2);
    assert(store.size() == 2);
    assert(store.get("a", v) && v == 1);
    // Overwrite
    store.put("a", 3);
    assert(store.get("a", v) && v == 3);
    assert(store.size() == 2);
    // Take removes
    assert(store.take("b", v) && v == 2);
    assert(!store.get("b", v));
    assert(!store.take("b", v));
    assert(store.remove("a"));
    assert(!store.remove("a"));
    assert(store.size() == 0);
    store.put("c", 4);
    store.clear();
    assert(store.size() == 0);
}

static void ttlTest() {
    Log log;
    TestClock clock(log);
    TtlEviction<string> policy(1000);
    KeyValueStore<string, int> store(clock, &policy);
    store.put("a", 1);
    clock.setTime(500);
    store.put("b", 2);
    int v = 0;
    clock.setTime(1000);
    // Exactly at the TTL is still good
    assert(store.get("a", v));
    clock.setTime(1001);
    assert(!store.get("a", v));
    assert(store.get("b", v) && v == 2);
    // Re-writing resets the age
    clock.setTime(1400);
    store.put("b", 5);
    clock.setTime(2300);
    assert(store.get("b", v) && v == 5);
    clock.setTime(2401);
    assert(store.size() == 0);
}

static void lruTest() {
    Log log;
    TestClock clock(log);
    LruEviction<string> policy(2);
    KeyValueStore<string, int> store(clock, &policy);
    store.put("a", 1);
    store.put("b", 2);
    int v = 0;
    // Makes "b" the oldest
    assert(store.get("a", v));
    store.put("c", 3);
    assert(store.size() == 2);
    assert(!store.get("b", v));
    assert(store.get("a", v));
    assert(store.get("c", v));
    // Removing frees up room
    assert(store.remove("a"));
    store.put("d", 4);
    assert(store.get("c", v) && v == 3);
    assert(store.get("d", v) && v == 4);
}

static void threadTest() {
    Log log;
    TestClock clock(log);
    KeyValueStore<unsigned, unsigned> store(clock);
    vector<thread> threads;
    for (unsigned t = 0; t < 4; t++)
        threads.push_back(thread([&store, t]() {
            for (unsigned i = 0; i < 500; i++)
                store.put(t * 1000 + i, i);
            for (unsigned i = 0; i < 250; i++) {
                unsigned v;
                assert(store.take(t * 1000 + i, v) && v == i);
            }
        }));
    for (auto& th : threads)
        th.join();
    assert(store.size() == 1000);
}

int main(int, const char**) {
    basicTest();
    ttlTest();
    lruTest();
    threadTest();
    cout << "store-test OK" << endl;
    return 0;
}
