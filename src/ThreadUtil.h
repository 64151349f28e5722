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

namespace kc1fsz {
    namespace gwbridge {

/**
 * Names the calling thread so that it shows up in the log and in tools
 * like top -H. Names longer than 15 characters are truncated.
 */
void setThreadName(const char* name);

/**
 * Fills buf with the calling thread's name (empty if unavailable).
 */
void getThreadName(char* buf, unsigned bufLen);

/**
 * Puts the calling thread back onto the normal scheduler. Used for
 * housekeeping threads that should never compete with audio relay.
 */
void lowerThreadPriority();

    }
}
