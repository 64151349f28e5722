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
#include <poll.h>
#include <algorithm>

#include "kc1fsz-tools/Log.h"
#include "kc1fsz-tools/StdPollTimer.h"

#include "Runnable2.h"
#include "EventLoop.h"

namespace kc1fsz {

void EventLoop::run(Log& log, Clock& clock,
    Runnable2** tasks, unsigned taskCount,
    std::function<bool(Log& log, Clock& clock)> cb,
    unsigned maxSleepMs, bool trace) {

    StdPollTimer timer1s(clock, 1000000);
    StdPollTimer timer10s(clock, 10000000);

    timer1s.reset();
    timer10s.reset();

    unsigned long slowestLoopUs = 0;
    unsigned long totalWorkUs = 0;
    unsigned long loopCount = 0;
    bool morePending = false;

    while (true) {

        // Gather the FDs that we care about
        const unsigned fdsCapacity = 32;
        unsigned fdsSize = 0;
        pollfd fds[fdsCapacity];

        for (unsigned i = 0; i < taskCount; i++) {
            int used = tasks[i]->getPolls(fds + fdsSize, fdsCapacity - fdsSize);
            if (used < 0) {
                log.error("Not enough poll fds");
                break;
            }
            fdsSize += used;
        }

        // Sleep until the next second tick, but no longer than allowed,
        // and not at all if a task said that it has more to do
        uint32_t sleepMs = timer1s.usLeftInInterval() / 1000;
        sleepMs = std::min(sleepMs, (uint32_t)maxSleepMs);
        if (morePending)
            sleepMs = 0;

        int rc = poll(fds, fdsSize, sleepMs);
        if (rc < 0) {
            log.error("Poll error");
        }

        unsigned long workStartUs = clock.timeUs();

        morePending = false;
        for (unsigned i = 0; i < taskCount; i++)
            if (tasks[i]->run2())
                morePending = true;

        if (timer1s.poll()) {
            for (unsigned i = 0; i < taskCount; i++)
                tasks[i]->oneSecTick();
        }

        bool showStats = false;

        if (timer10s.poll()) {
            for (unsigned i = 0; i < taskCount; i++)
                tasks[i]->tenSecTick();
            showStats = true;
        }

        if (cb) {
            if (cb(log, clock) == false)
                break;
        }

        unsigned long workTimeUs = clock.timeUs() - workStartUs;
        totalWorkUs += workTimeUs;
        if (workTimeUs > slowestLoopUs)
            slowestLoopUs = workTimeUs;

        loopCount++;

        if (trace && showStats) {
            log.info("Loops: %6lu, AvgWork: %6lu, MaxWork: %6lu",
                loopCount, totalWorkUs / loopCount, slowestLoopUs);
            totalWorkUs = 0;
            slowestLoopUs = 0;
            loopCount = 0;
        }
    }
}

}
