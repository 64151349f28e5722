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
#include <stdio.h>
#include <execinfo.h>
#include <signal.h>
#include <unistd.h>

#include <atomic>
#include <iostream>
#include <memory>

#include <curl/curl.h>

#include "kc1fsz-tools/linux/StdClock.h"

#include "gwbridge/Errors.h"
#include "gwbridge/SessionConfig.h"

#include "Config.h"
#include "ServiceLog.h"
#include "EventLoop.h"
#include "FilePoller.h"
#include "ThreadUtil.h"
#include "GeminiLiveTransport.h"
#include "PiperTtsEngine.h"
#include "TtsRouter.h"
#include "HybridSession.h"
#include "SessionPool.h"
#include "CallManager.h"
#include "JsonDirectory.h"
#include "InboundRouter.h"
#include "ToolExecutor.h"
#include "GatewayServer.h"
#include "StatusServer.h"
#include "PoolMonitor.h"

using namespace std;
using namespace kc1fsz;
using namespace kc1fsz::gwbridge;

static std::atomic<bool> runFlag(true);

static void stopHandler(int) {
    runFlag = false;
}

static void sigHandler(int sig) {
    void *array[32];
    size_t size = backtrace(array, 32);
    fprintf(stderr, "Error: signal %d:\n", sig);
    backtrace_symbols_fd(array, size, STDERR_FILENO);
    signal(sig, SIG_DFL);
    raise(sig);
}

int main(int argc, const char** argv) {

    signal(SIGSEGV, sigHandler);
    signal(SIGINT, stopHandler);
    signal(SIGTERM, stopHandler);
    signal(SIGPIPE, SIG_IGN);

    if (argc < 2) {
        cerr << "Usage: gwbridge-server <config.json>" << endl;
        return -1;
    }

    Config cfg;
    try {
        cfg = Config::load(argv[1]);
    } catch (const ConfigurationError& ex) {
        cerr << ex.what() << endl;
        return -1;
    }

    curl_global_init(CURL_GLOBAL_DEFAULT);
    setThreadName("main");

    ServiceLog log(cfg.logServiceName, cfg.logEnv, cfg.logApiKey);
    log.info("gwbridge-server starting");
    log.info("Configuration %s", cfg.toJson().dump().c_str());

    if (cfg.upstreamApiKey.empty())
        log.error("No upstream API key (set %s), every session will fail", Config::API_KEY_ENV);

    StdClock clock;

    // ----- Upstream -----------------------------------------------------------

    UpstreamSettings upstream;
    upstream.url = cfg.upstreamUrl;
    upstream.apiKey = cfg.upstreamApiKey;
    upstream.inputRate = cfg.upstreamInputRate;
    upstream.outputRate = cfg.upstreamOutputRate;
    upstream.connectTimeoutMs = cfg.connectTimeoutMs;

    // ----- TTS for hybrid sessions --------------------------------------------

    TtsRouter tts(log);
    unique_ptr<PiperTtsEngine> piper;
    if (!cfg.piperDir.empty()) {
        piper.reset(new PiperTtsEngine(log, cfg.piperDir, cfg.ttsSampleRate));
        tts.registerEngine("piper", piper.get());
        tts.setFallback("piper");
    }
    LruEviction<string> ttsCachePolicy(cfg.ttsCacheEntries);
    TtsCache ttsCache(clock, &ttsCachePolicy);

    // ----- Sessions and calls -------------------------------------------------

    SessionConfig defaults;
    defaults.modelId = cfg.defaultModelId;
    defaults.voiceName = cfg.defaultVoice;
    defaults.systemInstruction = cfg.defaultSystemInstruction;
    defaults.timeoutSec = cfg.sessionTimeoutSec;
    defaults.toolNames = cfg.toolNames;

    try {
        defaults.validate();
    } catch (const ConfigurationError& ex) {
        log.error("Bad session defaults: %s", ex.what());
        return -1;
    }

    SessionPool pool(log,
        makeSessionFactory(log, GeminiLiveTransport::factory(log, upstream),
            cfg.extendBufferSec, &tts, &ttsCache),
        cfg.maxSessions, defaults);
    CallManager calls(log, pool, cfg.acquireTimeoutMs);

    // ----- Routing and tools --------------------------------------------------

    JsonDirectory directory(log, cfg.interactionLogFile);
    InboundRouter router(log, directory);
    ToolExecutor tools(log);
    tools.registerStandardTools(directory, InboundRouter::DEFAULT_LOOKUP_TIMEOUT_MS);

    unique_ptr<FilePoller> directoryPoller;
    if (!cfg.directoryFile.empty()) {
        directoryPoller.reset(new FilePoller(log, cfg.directoryFile,
            [&log, &directory](const nlohmann::json& doc) {
                directory.load(doc);
                log.info("Directory loaded: %u gateways, %u rules",
                    directory.gatewayCount(), directory.ruleCount());
            }));
        directoryPoller->check();
    } else {
        log.info("No directory file, every call will be answered");
    }

    // ----- Network ------------------------------------------------------------

    BridgeSettings bridge;
    bridge.gatewayRate = cfg.gatewaySampleRate;
    bridge.upstreamInputRate = cfg.upstreamInputRate;
    bridge.upstreamOutputRate = cfg.upstreamOutputRate;
    bridge.pendingDecisionTtlMs = cfg.pendingDecisionTtlMs;

    GatewayServer gateways(log, clock, cfg.listenHost, cfg.listenPort, cfg.maxSessions,
        calls, &router, &tools, bridge);
    try {
        gateways.start();
    } catch (const BridgeError& ex) {
        log.error("%s", ex.what());
        return -1;
    }

    unique_ptr<StatusServer> status;
    if (cfg.statusPort != 0) {
        status.reset(new StatusServer(log, pool, calls, cfg.listenHost, cfg.statusPort));
        status->start();
    }

    PoolMonitor monitor(log, pool, calls);

    // ----- Main loop ----------------------------------------------------------

    Runnable2* tasks2[4] = { &gateways, &monitor };
    unsigned task2Count = 2;
    if (directoryPoller)
        tasks2[task2Count++] = directoryPoller.get();

    EventLoop::run(log, clock, tasks2, task2Count,
        [](Log&, Clock&) { return runFlag.load(); });

    // ----- Orderly shutdown ---------------------------------------------------

    log.info("Shutting down");
    if (status)
        status->stop();
    gateways.stop();
    calls.teardownAll();
    pool.teardownAll();
    log.info("Done");
    log.stop();

    curl_global_cleanup();

    return 0;
}
