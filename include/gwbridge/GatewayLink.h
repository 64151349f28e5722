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
#include <string>

namespace kc1fsz {
    namespace gwbridge {

/**
 * The abstract interface to the socket that connects us to one gateway
 * device. Implementations must be thread-safe.
 */
class GatewayLink {
public:

    virtual ~GatewayLink() { }

    /**
     * @returns false if the frame could not be sent (i.e. the link is
     * already closed).
     */
    virtual bool sendText(const std::string& text) = 0;

    virtual bool sendBinary(const uint8_t* data, unsigned len) = 0;

    virtual void close() = 0;
};

    }
}
