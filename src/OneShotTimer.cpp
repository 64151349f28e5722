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
#include "ThreadUtil.h"
#include "OneShotTimer.h"

using namespace std;

namespace kc1fsz {
    namespace gwbridge {

OneShotTimer::OneShotTimer(const string& threadName)
:   _threadName(threadName) {
}

OneShotTimer::~OneShotTimer() {
    {
        lock_guard<mutex> guard(_lock);
        _run = false;
        _pending = false;
    }
    _cv.notify_all();
    if (_thread.joinable()) {
        if (_thread.get_id() == this_thread::get_id())
            _thread.detach();
        else
            _thread.join();
    }
}

void OneShotTimer::schedule(unsigned delayMs, function<void()> cb) {
    {
        lock_guard<mutex> guard(_lock);
        _deadline = chrono::steady_clock::now() + chrono::milliseconds(delayMs);
        _cb = cb;
        _pending = true;
        if (!_thread.joinable())
            _thread = thread(&OneShotTimer::_loop, this);
    }
    _cv.notify_all();
}

void OneShotTimer::cancel() {
    {
        lock_guard<mutex> guard(_lock);
        _pending = false;
        _cb = nullptr;
    }
    _cv.notify_all();
}

bool OneShotTimer::isPending() {
    lock_guard<mutex> guard(_lock);
    return _pending;
}

void OneShotTimer::_loop() {

    setThreadName(_threadName.c_str());

    unique_lock<mutex> lock(_lock);

    while (_run) {
        if (!_pending) {
            _cv.wait(lock);
            continue;
        }
        if (chrono::steady_clock::now() < _deadline) {
            _cv.wait_until(lock, _deadline);
            continue;
        }
        // Fire
        function<void()> cb = _cb;
        _cb = nullptr;
        _pending = false;
        lock.unlock();
        if (cb)
            cb();
        lock.lock();
    }
}

    }
}
