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
#pragma once

#include <cstdint>
#include <vector>

namespace kc1fsz {
    namespace gwbridge {

/**
 * Linear-interpolation rate converter for 16-bit signed little-endian
 * mono PCM. There is no state carried between calls so the same
 * instance can be shared by any number of threads.
 *
 * Works in either direction (i.e. 24K->16K for audio headed to the
 * gateway, 16K->24K or anything else for audio headed upstream).
 */
class Resampler {
public:

    Resampler() { }
    Resampler(unsigned inRate, unsigned outRate);

    /**
     * Throws std::invalid_argument if either rate is zero.
     */
    void setRates(unsigned inRate, unsigned outRate);

    unsigned getInRate() const { return _inRate; }
    unsigned getOutRate() const { return _outRate; }

    /**
     * @param in Packed PCM16 LE samples.
     * @param inLen Length of the input in BYTES.
     * @param out Receives the converted samples, packed PCM16 LE. Anything
     * already in the vector is discarded.
     * @throws MalformedAudioError if inLen is odd.
     */
    void resample(const uint8_t* in, unsigned inLen, std::vector<uint8_t>& out) const;

private:

    unsigned _inRate = 16000;
    unsigned _outRate = 16000;
};

/**
 * Stateless convenience form of Resampler::resample().
 */
std::vector<uint8_t> resample(const std::vector<uint8_t>& data,
    unsigned sourceRate, unsigned targetRate);

/**
 * @returns The number of output samples produced for inCount input samples.
 */
unsigned resampledCount(unsigned inCount, unsigned sourceRate, unsigned targetRate);

    }
}
