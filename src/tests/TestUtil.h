#pragma once

#include <cstdint>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <condition_variable>

#include <nlohmann/json.hpp>

#include "kc1fsz-tools/Clock.h"
#include "kc1fsz-tools/Log.h"

#include "gwbridge/Directory.h"
#include "gwbridge/GatewayLink.h"
#include "gwbridge/SessionConfig.h"
#include "gwbridge/StreamingTransport.h"
#include "gwbridge/TtsEngine.h"

namespace kc1fsz {

class Log;

class TestClock : public Clock {
public:

    TestClock(Log& log) : _log(log) { }

    uint32_t time() const { return _timeMs; }

    void setTime(uint32_t ms) {
        _timeMs = ms;
        _log.info("----- Time %u -----", _timeMs);
    }

    void increment(uint32_t ms) {
        setTime(time() + ms);
    }

    Log& _log;
    uint32_t _timeMs = 0;
};

    namespace gwbridge {

class FakeTransport;

/**
 * Stands in for the upstream service. Must be made with make_shared().
 * Every transport made by factory() reports to this object, and the test
 * drives whichever one is current.
 */
class FakeUpstream : public std::enable_shared_from_this<FakeUpstream> {
public:

    TransportFactory factory();

    /**
     * Queues a response on the current connection.
     *
     * @returns false if there is no current connection.
     */
    bool push(const AgentResponse& r);
    bool pushAudio(unsigned bytes, unsigned rate = 24000);
    bool pushText(const std::string& text, bool turnComplete = false);

    /**
     * The upstream hangs up on the current connection.
     */
    void remoteClose();

    unsigned connectCount();
    unsigned closeCount();
    unsigned liveCount();
    std::vector<std::string> connectTokens();
    std::vector<unsigned> audioSentSizes();
    std::vector<std::string> textsSent();
    unsigned audioEndCount();
    std::vector<std::vector<ToolResult>> toolResponses();
    SessionConfig lastConfig();

    // Settings, changed between steps by the test
    void setFailConnect(bool f);
    void setFailSends(bool f);
    void setIssuedToken(const std::string& t);
    void setConnectDelayMs(unsigned ms);

private:

    friend class FakeTransport;

    std::mutex _lock;
    FakeTransport* _current = nullptr;
    unsigned _connectCount = 0;
    unsigned _closeCount = 0;
    unsigned _liveCount = 0;
    std::vector<std::string> _connectTokens;
    std::vector<unsigned> _audioSent;
    std::vector<std::string> _textsSent;
    unsigned _audioEndCount = 0;
    std::vector<std::vector<ToolResult>> _toolResponses;
    SessionConfig _lastConfig;
    bool _failConnect = false;
    bool _failSends = false;
    std::string _issuedToken = "token-1";
    unsigned _connectDelayMs = 0;
};

class FakeTransport : public StreamingTransport {
public:

    FakeTransport(std::shared_ptr<FakeUpstream> up, const SessionConfig& cfg);
    ~FakeTransport();

    void connect(const std::string& resumptionToken);
    void sendAudio(const uint8_t* data, unsigned len);
    void sendAudioEnd();
    void sendText(const std::string& text);
    void sendToolResponse(const std::vector<ToolResult>& results);
    bool receive(AgentResponse& out, unsigned timeoutMs);
    bool isOpen() const;
    std::string resumptionToken() const;
    void close();

    // Called by FakeUpstream with its lock held
    void deliver(const AgentResponse& r);
    void hangUp();

private:

    void _checkSend();

    std::shared_ptr<FakeUpstream> _up;
    mutable std::mutex _lock;
    std::condition_variable _cv;
    std::deque<AgentResponse> _queue;
    bool _open = false;
    bool _closed = false;
    std::string _token;
};

/**
 * An in-memory Directory whose futures are ready immediately, unless
 * the test asks for failures or hangs.
 */
class FakeDirectory : public Directory {
public:

    std::vector<GatewayDevice> gateways;
    std::vector<Contact> contacts;
    std::vector<RoutingRule> rules;
    std::vector<InteractionRecord> interactions;

    bool failGateway = false;
    bool failRules = false;
    // The rules future never becomes ready
    bool hangRules = false;
    unsigned rulesLookups = 0;

    std::future<std::optional<GatewayDevice>> findGateway(const std::string& gatewayId);
    std::future<std::optional<Contact>> findContact(const std::string& orgId,
        const std::string& phone);
    std::future<std::optional<Contact>> findContactByPhone(const std::string& phone);
    std::future<std::vector<RoutingRule>> activeRules(const std::string& orgId);
    std::future<void> appendInteraction(const InteractionRecord& rec);

private:

    std::mutex _lock;
    // Kept so that hung futures don't report a broken promise
    std::vector<std::shared_ptr<std::promise<std::vector<RoutingRule>>>> _hung;
};

/**
 * Makes 100 samples of audio per character of text.
 */
class FakeTts : public TtsEngine {
public:

    unsigned rate = 16000;
    bool fail = false;
    unsigned calls = 0;
    std::string lastVoice;

    unsigned synthesize(const std::string& text, const TtsConfig& cfg,
        std::vector<uint8_t>& pcmOut);
};

/**
 * Records everything sent to the device.
 */
class FakeLink : public GatewayLink {
public:

    bool sendText(const std::string& text);
    bool sendBinary(const uint8_t* data, unsigned len);
    void close();

    std::vector<nlohmann::json> frames();
    /**
     * @returns The frames of one type, in order.
     */
    std::vector<nlohmann::json> frames(const std::string& type);
    std::vector<unsigned> binarySizes();
    unsigned binaryBytes();
    void clear();

    bool closed = false;

private:

    std::mutex _lock;
    std::vector<std::string> _texts;
    std::vector<unsigned> _binaries;
};

/**
 * @returns size bytes of a PCM16 ramp.
 */
std::vector<uint8_t> makePcm(unsigned bytes);

    }
}
