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
#include <cmath>
#include <stdexcept>

#include "kc1fsz-tools/Common.h"

#include "gwbridge/Errors.h"
#include "gwbridge/Resampler.h"

using namespace std;

namespace kc1fsz {
    namespace gwbridge {

Resampler::Resampler(unsigned inRate, unsigned outRate) {
    setRates(inRate, outRate);
}

void Resampler::setRates(unsigned inRate, unsigned outRate) {
    if (inRate == 0 || outRate == 0)
        throw invalid_argument("Sample rate must be positive");
    _inRate = inRate;
    _outRate = outRate;
}

unsigned resampledCount(unsigned inCount, unsigned sourceRate, unsigned targetRate) {
    // Integer math gives an exact floor
    return (unsigned)(((uint64_t)inCount * (uint64_t)targetRate) / (uint64_t)sourceRate);
}

void Resampler::resample(const uint8_t* in, unsigned inLen, vector<uint8_t>& out) const {

    out.clear();

    if (inLen == 0)
        return;
    if (inLen % 2 != 0)
        throw MalformedAudioError("PCM16 buffer has odd length " + to_string(inLen));

    const unsigned inCount = inLen / 2;

    // Not enough to interpolate between
    if (inCount < 2) {
        out.assign(in, in + inLen);
        return;
    }

    const unsigned outCount = resampledCount(inCount, _inRate, _outRate);
    const double ratio = (double)_inRate / (double)_outRate;
    out.resize(outCount * 2);

    for (unsigned i = 0; i < outCount; i++) {
        const double srcPos = (double)i * ratio;
        const unsigned idx = (unsigned)srcPos;
        const double frac = srcPos - (double)idx;
        double sample;
        if (idx + 1 < inCount) {
            const double s0 = unpack_int16_le(in + idx * 2);
            const double s1 = unpack_int16_le(in + (idx + 1) * 2);
            sample = s0 + frac * (s1 - s0);
        } else {
            sample = unpack_int16_le(in + idx * 2);
        }
        // Ties go to even
        long v = lrint(sample);
        if (v > 32767)
            v = 32767;
        else if (v < -32768)
            v = -32768;
        pack_int16_le((int16_t)v, out.data() + i * 2);
    }
}

vector<uint8_t> resample(const vector<uint8_t>& data, unsigned sourceRate, unsigned targetRate) {
    Resampler r(sourceRate, targetRate);
    vector<uint8_t> out;
    r.resample(data.data(), data.size(), out);
    return out;
}

    }
}
