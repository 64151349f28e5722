#include <chrono>
#include <thread>

#include "gwbridge/Errors.h"

#include "TestUtil.h"

using namespace std;
using json = nlohmann::json;

namespace kc1fsz {
    namespace gwbridge {

// ----- FakeUpstream ------------------------------------------------------------

TransportFactory FakeUpstream::factory() {
    shared_ptr<FakeUpstream> self = shared_from_this();
    return [self](const SessionConfig& cfg) {
        return std::unique_ptr<StreamingTransport>(new FakeTransport(self, cfg));
    };
}

bool FakeUpstream::push(const AgentResponse& r) {
    lock_guard<mutex> lock(_lock);
    if (!_current)
        return false;
    _current->deliver(r);
    return true;
}

bool FakeUpstream::pushAudio(unsigned bytes, unsigned rate) {
    AgentResponse r;
    r.audio = makePcm(bytes);
    r.audioRate = rate;
    return push(r);
}

bool FakeUpstream::pushText(const string& text, bool turnComplete) {
    AgentResponse r;
    r.text = text;
    r.turnComplete = turnComplete;
    return push(r);
}

void FakeUpstream::remoteClose() {
    lock_guard<mutex> lock(_lock);
    if (_current) {
        _current->hangUp();
        _current = nullptr;
    }
}

unsigned FakeUpstream::connectCount() {
    lock_guard<mutex> lock(_lock);
    return _connectCount;
}

unsigned FakeUpstream::closeCount() {
    lock_guard<mutex> lock(_lock);
    return _closeCount;
}

unsigned FakeUpstream::liveCount() {
    lock_guard<mutex> lock(_lock);
    return _liveCount;
}

vector<string> FakeUpstream::connectTokens() {
    lock_guard<mutex> lock(_lock);
    return _connectTokens;
}

vector<unsigned> FakeUpstream::audioSentSizes() {
    lock_guard<mutex> lock(_lock);
    return _audioSent;
}

vector<string> FakeUpstream::textsSent() {
    lock_guard<mutex> lock(_lock);
    return _textsSent;
}

unsigned FakeUpstream::audioEndCount() {
    lock_guard<mutex> lock(_lock);
    return _audioEndCount;
}

vector<vector<ToolResult>> FakeUpstream::toolResponses() {
    lock_guard<mutex> lock(_lock);
    return _toolResponses;
}

SessionConfig FakeUpstream::lastConfig() {
    lock_guard<mutex> lock(_lock);
    return _lastConfig;
}

void FakeUpstream::setFailConnect(bool f) {
    lock_guard<mutex> lock(_lock);
    _failConnect = f;
}

void FakeUpstream::setFailSends(bool f) {
    lock_guard<mutex> lock(_lock);
    _failSends = f;
}

void FakeUpstream::setIssuedToken(const string& t) {
    lock_guard<mutex> lock(_lock);
    _issuedToken = t;
}

void FakeUpstream::setConnectDelayMs(unsigned ms) {
    lock_guard<mutex> lock(_lock);
    _connectDelayMs = ms;
}

// ----- FakeTransport -----------------------------------------------------------

FakeTransport::FakeTransport(shared_ptr<FakeUpstream> up, const SessionConfig& cfg)
:   _up(up) {
    lock_guard<mutex> lock(_up->_lock);
    _up->_lastConfig = cfg;
}

FakeTransport::~FakeTransport() {
    lock_guard<mutex> lock(_up->_lock);
    if (_up->_current == this)
        _up->_current = nullptr;
    {
        lock_guard<mutex> lock2(_lock);
        if (_open)
            _up->_liveCount--;
    }
}

void FakeTransport::connect(const string& resumptionToken) {
    unsigned delayMs;
    {
        lock_guard<mutex> lock(_up->_lock);
        delayMs = _up->_connectDelayMs;
    }
    if (delayMs)
        std::this_thread::sleep_for(std::chrono::milliseconds(delayMs));

    lock_guard<mutex> lock(_up->_lock);
    _up->_connectCount++;
    _up->_connectTokens.push_back(resumptionToken);
    if (_up->_failConnect)
        throw TransportError("Connect refused");
    lock_guard<mutex> lock2(_lock);
    _open = true;
    _token = _up->_issuedToken;
    _up->_current = this;
    _up->_liveCount++;
}

void FakeTransport::_checkSend() {
    // Called with the upstream lock held
    if (_up->_failSends)
        throw TransportError("Send failed");
    lock_guard<mutex> lock(_lock);
    if (!_open)
        throw TransportError("Not connected");
}

void FakeTransport::sendAudio(const uint8_t*, unsigned len) {
    lock_guard<mutex> lock(_up->_lock);
    _checkSend();
    _up->_audioSent.push_back(len);
}

void FakeTransport::sendAudioEnd() {
    lock_guard<mutex> lock(_up->_lock);
    _checkSend();
    _up->_audioEndCount++;
}

void FakeTransport::sendText(const string& text) {
    lock_guard<mutex> lock(_up->_lock);
    _checkSend();
    _up->_textsSent.push_back(text);
}

void FakeTransport::sendToolResponse(const vector<ToolResult>& results) {
    lock_guard<mutex> lock(_up->_lock);
    _checkSend();
    _up->_toolResponses.push_back(results);
}

bool FakeTransport::receive(AgentResponse& out, unsigned timeoutMs) {
    unique_lock<mutex> lock(_lock);
    _cv.wait_for(lock, std::chrono::milliseconds(timeoutMs),
        [this]() { return !_queue.empty() || !_open; });
    if (_queue.empty())
        return false;
    out = _queue.front();
    _queue.pop_front();
    return true;
}

bool FakeTransport::isOpen() const {
    lock_guard<mutex> lock(_lock);
    return _open;
}

string FakeTransport::resumptionToken() const {
    lock_guard<mutex> lock(_lock);
    return _token;
}

void FakeTransport::close() {
    lock_guard<mutex> lock(_up->_lock);
    lock_guard<mutex> lock2(_lock);
    if (_closed)
        return;
    _closed = true;
    _up->_closeCount++;
    if (_open)
        _up->_liveCount--;
    _open = false;
    if (_up->_current == this)
        _up->_current = nullptr;
    _cv.notify_all();
}

void FakeTransport::deliver(const AgentResponse& r) {
    lock_guard<mutex> lock(_lock);
    _queue.push_back(r);
    _cv.notify_all();
}

void FakeTransport::hangUp() {
    lock_guard<mutex> lock(_lock);
    if (_open)
        _up->_liveCount--;
    _open = false;
    _cv.notify_all();
}

// ----- FakeDirectory -----------------------------------------------------------

template <class T> static future<T> ready(const T& value) {
    promise<T> p;
    p.set_value(value);
    return p.get_future();
}

template <class T> static future<T> failed(const string& msg) {
    promise<T> p;
    p.set_exception(make_exception_ptr(runtime_error(msg)));
    return p.get_future();
}

future<optional<GatewayDevice>> FakeDirectory::findGateway(const string& gatewayId) {
    lock_guard<mutex> lock(_lock);
    if (failGateway)
        return failed<optional<GatewayDevice>>("Database unavailable");
    for (const GatewayDevice& d : gateways)
        if (d.gatewayId == gatewayId)
            return ready(optional<GatewayDevice>(d));
    return ready(optional<GatewayDevice>());
}

future<optional<Contact>> FakeDirectory::findContact(const string& orgId, const string& phone) {
    lock_guard<mutex> lock(_lock);
    for (const Contact& c : contacts)
        if (c.orgId == orgId && c.phone == phone)
            return ready(optional<Contact>(c));
    return ready(optional<Contact>());
}

future<optional<Contact>> FakeDirectory::findContactByPhone(const string& phone) {
    lock_guard<mutex> lock(_lock);
    for (const Contact& c : contacts)
        if (c.phone == phone)
            return ready(optional<Contact>(c));
    return ready(optional<Contact>());
}

future<vector<RoutingRule>> FakeDirectory::activeRules(const string& orgId) {
    lock_guard<mutex> lock(_lock);
    rulesLookups++;
    if (failRules)
        return failed<vector<RoutingRule>>("Database unavailable");
    if (hangRules) {
        auto p = make_shared<promise<vector<RoutingRule>>>();
        _hung.push_back(p);
        return p->get_future();
    }
    vector<RoutingRule> result;
    for (const RoutingRule& r : rules)
        if (r.orgId == orgId && r.isActive)
            result.push_back(r);
    return ready(result);
}

future<void> FakeDirectory::appendInteraction(const InteractionRecord& rec) {
    lock_guard<mutex> lock(_lock);
    interactions.push_back(rec);
    promise<void> p;
    p.set_value();
    return p.get_future();
}

// ----- FakeTts -----------------------------------------------------------------

unsigned FakeTts::synthesize(const string& text, const TtsConfig& cfg, vector<uint8_t>& pcmOut) {
    calls++;
    lastVoice = cfg.voice;
    if (fail)
        throw TtsError("Engine failure");
    pcmOut = makePcm(text.size() * 200);
    return rate;
}

// ----- FakeLink ----------------------------------------------------------------

bool FakeLink::sendText(const string& text) {
    lock_guard<mutex> lock(_lock);
    if (closed)
        return false;
    _texts.push_back(text);
    return true;
}

bool FakeLink::sendBinary(const uint8_t*, unsigned len) {
    lock_guard<mutex> lock(_lock);
    if (closed)
        return false;
    _binaries.push_back(len);
    return true;
}

void FakeLink::close() {
    lock_guard<mutex> lock(_lock);
    closed = true;
}

vector<json> FakeLink::frames() {
    lock_guard<mutex> lock(_lock);
    vector<json> result;
    for (const string& t : _texts)
        result.push_back(json::parse(t));
    return result;
}

vector<json> FakeLink::frames(const string& type) {
    vector<json> result;
    for (const json& j : frames())
        if (j.value("type", "") == type)
            result.push_back(j);
    return result;
}

vector<unsigned> FakeLink::binarySizes() {
    lock_guard<mutex> lock(_lock);
    return _binaries;
}

unsigned FakeLink::binaryBytes() {
    lock_guard<mutex> lock(_lock);
    unsigned total = 0;
    for (unsigned n : _binaries)
        total += n;
    return total;
}

void FakeLink::clear() {
    lock_guard<mutex> lock(_lock);
    _texts.clear();
    _binaries.clear();
}

vector<uint8_t> makePcm(unsigned bytes) {
    vector<uint8_t> pcm(bytes);
    for (unsigned i = 0; i < bytes; i++)
        pcm[i] = (uint8_t)(i & 0xff);
    return pcm;
}

    }
}
