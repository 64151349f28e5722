#include <cassert>
#include <iostream>
#include <stdexcept>

#include "kc1fsz-tools/Common.h"

#include "gwbridge/Errors.h"
#include "gwbridge/Resampler.h"

using namespace std;
using namespace kc1fsz;
using namespace kc1fsz::gwbridge;

static vector<uint8_t> pack(const vector<int16_t>& samples) {
    vector<uint8_t> r(samples.size() * 2);
    for (unsigned i = 0; i < samples.size(); i++)
        pack_int16_le(samples[i], r.data() + i * 2);
    return r;
}

static int16_t sampleAt(const vector<uint8_t>& pcm, unsigned i) {
    return unpack_int16_le(pcm.data() + i * 2);
}

static void edgeTest() {
    // Empty in, empty out
    assert(resample(vector<uint8_t>(), 24000, 16000).empty());
    // Odd length
    bool thrown = false;
    try {
        resample(vector<uint8_t>(3), 24000, 16000);
    } catch (const MalformedAudioError&) {
        thrown = true;
    }
    assert(thrown);
    // One sample isn't enough to interpolate
    vector<uint8_t> one = pack({ 1234 });
    assert(resample(one, 24000, 16000) == one);
    // Zero rates are rejected
    thrown = false;
    try {
        Resampler r(0, 16000);
    } catch (const invalid_argument&) {
        thrown = true;
    }
    assert(thrown);
}

static void countTest() {
    assert(resampledCount(480, 24000, 16000) == 320);
    assert(resampledCount(320, 16000, 24000) == 480);
    // Floor
    assert(resampledCount(5, 24000, 16000) == 3);
    assert(resampledCount(2, 24000, 16000) == 1);
    vector<uint8_t> pcm(960);
    assert(resample(pcm, 24000, 16000).size() == 640);
    assert(resample(pcm, 16000, 8000).size() == 480);
}

static void interpolationTest() {
    // The first output sample has no fractional offset
    vector<uint8_t> out = resample(pack({ 1000, 2000 }), 24000, 16000);
    assert(out.size() == 2);
    assert(sampleAt(out, 0) == 1000);

    // Up-sampling 2x lands halfway between input samples
    out = resample(pack({ 0, 100, 200, 300 }), 8000, 16000);
    assert(out.size() == 16);
    assert(sampleAt(out, 0) == 0);
    assert(sampleAt(out, 1) == 50);
    assert(sampleAt(out, 2) == 100);
    assert(sampleAt(out, 3) == 150);
    // Past the last pair the floor sample is used alone
    assert(sampleAt(out, 6) == 300);
    assert(sampleAt(out, 7) == 300);

    // 3:2 down-sampling, positions 0, 1.5, 3
    out = resample(pack({ 0, 300, 600, 900, 1200, 1500 }), 24000, 16000);
    assert(out.size() == 8);
    assert(sampleAt(out, 0) == 0);
    assert(sampleAt(out, 1) == 450);
    assert(sampleAt(out, 2) == 900);
    assert(sampleAt(out, 3) == 1350);
}

static void roundingTest() {
    // Halfway values round to even
    vector<uint8_t> out = resample(pack({ 0, 1, 2, 3 }), 8000, 16000);
    // 0.5 -> 0, 1.5 -> 2, 2.5 -> 2
    assert(sampleAt(out, 1) == 0);
    assert(sampleAt(out, 3) == 2);
    assert(sampleAt(out, 5) == 2);
    // Extremes survive without wrapping
    out = resample(pack({ 32767, 32767, -32768, -32768 }), 8000, 16000);
    assert(sampleAt(out, 0) == 32767);
    assert(sampleAt(out, 7) == -32768);
}

static void sameRateTest() {
    vector<uint8_t> in = pack({ 5, -5, 700, -700, 32767 });
    assert(resample(in, 16000, 16000) == in);
}

static void instanceTest() {
    Resampler r(16000, 24000);
    assert(r.getInRate() == 16000);
    assert(r.getOutRate() == 24000);
    vector<uint8_t> in = pack({ 10, 20, 30, 40 });
    vector<uint8_t> out = { 1, 2, 3 };
    r.resample(in.data(), in.size(), out);
    assert(out.size() == 12);
    r.setRates(24000, 16000);
    r.resample(in.data(), in.size(), out);
    assert(out.size() == 4);
}

int main(int, const char**) {
    edgeTest();
    countTest();
    interpolationTest();
    roundingTest();
    sameRateTest();
    instanceTest();
    cout << "resampler-test OK" << endl;
    return 0;
}
