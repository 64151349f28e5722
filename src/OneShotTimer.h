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

#include <string>
#include <thread>
#include <mutex>
#include <chrono>
#include <functional>
#include <condition_variable>

namespace kc1fsz {
    namespace gwbridge {

/**
 * A cancellable delayed callback with its own thread. At most one
 * callback is scheduled at a time. The thread is started on the first
 * schedule() and lives until the timer is destroyed.
 *
 * The callback runs on the timer's thread with no lock held, so it is
 * allowed to call schedule() to re-arm itself.
 */
class OneShotTimer {
public:

    OneShotTimer(const std::string& threadName);
    ~OneShotTimer();

    OneShotTimer(const OneShotTimer&) = delete;
    OneShotTimer& operator=(const OneShotTimer&) = delete;

    /**
     * Replaces anything already scheduled.
     */
    void schedule(unsigned delayMs, std::function<void()> cb);

    /**
     * Drops the pending callback, if any. A callback that is already
     * running is not interrupted.
     */
    void cancel();

    bool isPending();

private:

    void _loop();

    const std::string _threadName;
    std::mutex _lock;
    std::condition_variable _cv;
    bool _run = true;
    bool _pending = false;
    std::chrono::steady_clock::time_point _deadline;
    std::function<void()> _cb;
    std::thread _thread;
};

    }
}
