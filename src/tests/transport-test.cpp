#include <cassert>
#include <iostream>

#include <nlohmann/json.hpp>

#include "gwbridge/Errors.h"
#include "gwbridge/SessionConfig.h"

#include "Base64.h"
#include "Catalog.h"
#include "GeminiLiveTransport.h"

using namespace std;
using namespace kc1fsz;
using namespace kc1fsz::gwbridge;

using json = nlohmann::json;

static void base64Test() {
    const uint8_t man[] = { 'M', 'a', 'n' };
    assert(base64Encode(man, 3) == "TWFu");
    assert(base64Encode(man, 2) == "TWE=");
    assert(base64Encode(man, 1) == "TQ==");
    assert(base64Encode(man, 0) == "");

    vector<uint8_t> out;
    assert(base64Decode("TWFu", out));
    assert(out.size() == 3 && out[2] == 'n');
    assert(base64Decode("TW\nE=", out));
    assert(out.size() == 2 && out[1] == 'a');
    assert(base64Decode("TQ==", out));
    assert(out.size() == 1);
    assert(!base64Decode("T*Fu", out));

    const uint8_t pcm[] = { 0x01, 0x02, 0x03, 0x04 };
    assert(base64Encode(pcm, 4) == "AQIDBA==");
}

static void catalogTest() {
    assert(isKnownVoice("Puck"));
    assert(!isKnownVoice("puck"));
    assert(!voiceNames().empty());
    assert(isKnownTool("transfer_to_human"));
    assert(!isKnownTool("launch_missiles"));
    json d = toolDeclarations({ "lookup_account" });
    assert(d.size() == 1);
    assert(d[0]["name"] == "lookup_account");
    bool thrown = false;
    try {
        toolDeclarations({ "launch_missiles" });
    } catch (const ConfigurationError&) {
        thrown = true;
    }
    assert(thrown);
}

static void setupTest() {
    SessionConfig cfg;
    cfg.modelId = "gemini-live-test";
    cfg.voiceName = "Kore";
    cfg.systemInstruction = "Be brief.";
    cfg.toolNames = { "lookup_account", "transfer_to_human" };

    json m = GeminiLiveTransport::makeSetup(cfg, "");
    const json& s = m["setup"];
    assert(s["model"] == "models/gemini-live-test");
    assert(s["generationConfig"]["responseModalities"][0] == "AUDIO");
    assert(s["generationConfig"]["speechConfig"]["voiceConfig"]["prebuiltVoiceConfig"]["voiceName"] == "Kore");
    assert(s["systemInstruction"]["parts"][0]["text"] == "Be brief.");
    assert(s.contains("inputAudioTranscription"));
    assert(s.contains("outputAudioTranscription"));
    assert(s["tools"][0]["functionDeclarations"].size() == 2);
    // Resumption is always requested
    assert(s["sessionResumption"].is_object());
    assert(!s["sessionResumption"].contains("handle"));

    // Resuming, already-qualified model, text output
    cfg.modelId = "models/already";
    cfg.outputMode = OutputMode::HYBRID;
    cfg.systemInstruction.clear();
    cfg.toolNames.clear();
    cfg.inputTranscription = false;
    m = GeminiLiveTransport::makeSetup(cfg, "handle-42");
    const json& s2 = m["setup"];
    assert(s2["model"] == "models/already");
    assert(s2["generationConfig"]["responseModalities"][0] == "TEXT");
    assert(!s2["generationConfig"].contains("speechConfig"));
    assert(!s2.contains("systemInstruction"));
    assert(!s2.contains("tools"));
    assert(!s2.contains("inputAudioTranscription"));
    assert(s2["sessionResumption"]["handle"] == "handle-42");

    cfg.toolNames = { "launch_missiles" };
    bool thrown = false;
    try {
        GeminiLiveTransport::makeSetup(cfg, "");
    } catch (const ConfigurationError&) {
        thrown = true;
    }
    assert(thrown);
}

static void parseTest() {
    AgentResponse r;
    string token;

    json audio = json::parse(R"({"serverContent":{"modelTurn":{"parts":[
        {"inlineData":{"mimeType":"audio/pcm;rate=22050","data":"AQIDBA=="}},
        {"inlineData":{"mimeType":"audio/pcm","data":"AQI="}}]}}})");
    assert(GeminiLiveTransport::parseServerMessage(audio, 24000, r, token));
    assert(r.audio.size() == 6);
    assert(r.audio[0] == 1 && r.audio[5] == 2);
    // The last part says nothing so the default applies
    assert(r.audioRate == 24000);
    assert(token.empty());

    r = AgentResponse();
    json text = json::parse(R"({"serverContent":{"modelTurn":{"parts":[{"text":"Hello "},{"text":"there"}]},
        "turnComplete":true}})");
    assert(GeminiLiveTransport::parseServerMessage(text, 24000, r, token));
    assert(r.text == "Hello there");
    assert(r.turnComplete);
    assert(!r.hasAudio());

    r = AgentResponse();
    json tx = json::parse(R"({"serverContent":{"inputTranscription":{"text":"hi"},
        "outputTranscription":{"text":"hello"},"interrupted":true}})");
    assert(GeminiLiveTransport::parseServerMessage(tx, 24000, r, token));
    assert(r.inputTranscript == "hi");
    assert(r.outputTranscript == "hello");
    assert(r.interrupted);

    r = AgentResponse();
    json tool = json::parse(R"({"toolCall":{"functionCalls":[
        {"id":"fc-1","name":"lookup_account","args":{"phone_number":"+1555"}},
        {"id":"fc-2","name":"transfer_to_human"}]}})");
    assert(GeminiLiveTransport::parseServerMessage(tool, 24000, r, token));
    assert(r.toolCalls.size() == 2);
    assert(r.toolCalls[0].args["phone_number"] == "+1555");
    assert(r.toolCalls[1].args.is_object());

    // Token updates carry no response
    r = AgentResponse();
    json upd = json::parse(R"({"sessionResumptionUpdate":{"newHandle":"h-1","resumable":true}})");
    assert(!GeminiLiveTransport::parseServerMessage(upd, 24000, r, token));
    assert(token == "h-1");

    token.clear();
    json notResumable = json::parse(R"({"sessionResumptionUpdate":{"newHandle":"h-2","resumable":false}})");
    assert(!GeminiLiveTransport::parseServerMessage(notResumable, 24000, r, token));
    assert(token.empty());

    json other = json::parse(R"({"usageMetadata":{"totalTokenCount":10}})");
    assert(!GeminiLiveTransport::parseServerMessage(other, 24000, r, token));
}

int main(int, const char**) {
    base64Test();
    catalogTest();
    setupTest();
    parseTest();
    cout << "transport-test OK" << endl;
    return 0;
}
