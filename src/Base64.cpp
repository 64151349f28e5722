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
#include "Base64.h"

using namespace std;

namespace kc1fsz {
    namespace gwbridge {

static const char* ALPHABET =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

string base64Encode(const uint8_t* data, unsigned len) {
    string out;
    out.reserve(((len + 2) / 3) * 4);
    unsigned i = 0;
    while (i + 3 <= len) {
        uint32_t v = (data[i] << 16) | (data[i + 1] << 8) | data[i + 2];
        out += ALPHABET[(v >> 18) & 0x3f];
        out += ALPHABET[(v >> 12) & 0x3f];
        out += ALPHABET[(v >> 6) & 0x3f];
        out += ALPHABET[v & 0x3f];
        i += 3;
    }
    unsigned rem = len - i;
    if (rem == 1) {
        uint32_t v = data[i] << 16;
        out += ALPHABET[(v >> 18) & 0x3f];
        out += ALPHABET[(v >> 12) & 0x3f];
        out += "==";
    } else if (rem == 2) {
        uint32_t v = (data[i] << 16) | (data[i + 1] << 8);
        out += ALPHABET[(v >> 18) & 0x3f];
        out += ALPHABET[(v >> 12) & 0x3f];
        out += ALPHABET[(v >> 6) & 0x3f];
        out += '=';
    }
    return out;
}

static int decodeChar(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

bool base64Decode(const string& text, vector<uint8_t>& out) {
    out.clear();
    out.reserve((text.size() / 4) * 3);
    uint32_t acc = 0;
    unsigned bits = 0;
    for (char c : text) {
        if (c == '=')
            break;
        if (c == ' ' || c == '\n' || c == '\r' || c == '\t')
            continue;
        int v = decodeChar(c);
        if (v < 0)
            return false;
        acc = (acc << 6) | (uint32_t)v;
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back((uint8_t)((acc >> bits) & 0xff));
        }
    }
    return true;
}

    }
}
