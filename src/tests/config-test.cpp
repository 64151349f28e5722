#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

#include "gwbridge/Errors.h"

#include "Config.h"

using namespace std;
using namespace kc1fsz;
using namespace kc1fsz::gwbridge;

using json = nlohmann::json;

static void defaultsTest() {
    Config cfg;
    assert(cfg.listenPort == 8765);
    assert(cfg.maxSessions == 1000);
    assert(cfg.gatewaySampleRate == 16000);
    assert(cfg.upstreamOutputRate == 24000);
    assert(cfg.toolNames.size() == 2);
    assert(cfg.upstreamApiKey.empty());

    // Everything survives a trip through JSON
    cfg.listenPort = 9000;
    cfg.defaultVoice = "Puck";
    Config cfg2;
    cfg2.fromJson(cfg.toJson());
    assert(cfg2.listenPort == 9000);
    assert(cfg2.defaultVoice == "Puck");
    assert(cfg2.toJson() == cfg.toJson());
}

static void partialTest() {
    Config cfg;
    json j;
    j["maxSessions"] = 5;
    j["toolNames"] = json::array({ "lookup_account" });
    j["directoryFile"] = "/etc/gwbridge/directory.json";
    j["statusPort"] = 0;
    j["logEnv"] = nullptr;
    cfg.fromJson(j);
    assert(cfg.maxSessions == 5);
    assert(cfg.toolNames.size() == 1);
    assert(cfg.directoryFile == "/etc/gwbridge/directory.json");
    assert(cfg.statusPort == 0);
    // Untouched
    assert(cfg.logEnv == "dev");
    assert(cfg.listenPort == 8765);
}

static void badValueTest() {
    {
        Config cfg;
        bool thrown = false;
        try {
            cfg.fromJson(json::parse("{\"listenPort\":\"eighty\"}"));
        } catch (const ConfigurationError& ex) {
            thrown = true;
            assert(string(ex.what()).find("listenPort") != string::npos);
        }
        assert(thrown);
    }
    {
        Config cfg;
        bool thrown = false;
        try {
            cfg.fromJson(json::parse("{\"maxSessions\":0}"));
        } catch (const ConfigurationError&) {
            thrown = true;
        }
        assert(thrown);
    }
    {
        Config cfg;
        bool thrown = false;
        try {
            cfg.fromJson(json::parse("{\"listenPort\":70000}"));
        } catch (const ConfigurationError&) {
            thrown = true;
        }
        assert(thrown);
    }
    {
        Config cfg;
        bool thrown = false;
        try {
            cfg.fromJson(json::parse("[1,2]"));
        } catch (const ConfigurationError&) {
            thrown = true;
        }
        assert(thrown);
    }
}

static void secretTest() {
    Config cfg;
    cfg.upstreamApiKey = "AIza-secret";
    cfg.logApiKey = "nr-secret";
    string dump = cfg.toJson().dump();
    assert(dump.find("AIza-secret") == string::npos);
    assert(dump.find("nr-secret") == string::npos);
    assert(cfg.toJson()["upstreamApiKey"] == "********");
}

static void loadTest() {
    const char* fn = "/tmp/gwbridge-config-test.json";
    {
        ofstream f(fn);
        f << "{ \"listenPort\": 9100, \"maxSessions\": 12, \"upstreamApiKey\": \"from-file\" }";
    }

    unsetenv(Config::API_KEY_ENV);
    Config cfg = Config::load(fn);
    assert(cfg.listenPort == 9100);
    assert(cfg.maxSessions == 12);
    assert(cfg.upstreamApiKey == "from-file");

    // The environment wins
    setenv(Config::API_KEY_ENV, "from-env", 1);
    cfg = Config::load(fn);
    assert(cfg.upstreamApiKey == "from-env");
    unsetenv(Config::API_KEY_ENV);

    {
        ofstream f(fn);
        f << "{ \"listenPort\": ";
    }
    bool thrown = false;
    try {
        Config::load(fn);
    } catch (const ConfigurationError& ex) {
        thrown = true;
        assert(string(ex.what()).find("Invalid format") != string::npos);
    }
    assert(thrown);
    remove(fn);

    thrown = false;
    try {
        Config::load("/tmp/gwbridge-no-such-config.json");
    } catch (const ConfigurationError&) {
        thrown = true;
    }
    assert(thrown);
}

int main(int, const char**) {
    defaultsTest();
    partialTest();
    badValueTest();
    secretTest();
    loadTest();
    cout << "config-test OK" << endl;
    return 0;
}
