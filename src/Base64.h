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
#include <vector>

namespace kc1fsz {
    namespace gwbridge {

/**
 * Standard alphabet, with padding.
 */
std::string base64Encode(const uint8_t* data, unsigned len);

/**
 * Whitespace is skipped.
 *
 * @returns false if an illegal character is encountered.
 */
bool base64Decode(const std::string& text, std::vector<uint8_t>& out);

    }
}
