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
#include <list>
#include <map>
#include <mutex>
#include <vector>
#include <functional>

#include "kc1fsz-tools/Clock.h"

namespace kc1fsz {
    namespace gwbridge {

/**
 * Decides which entries of a KeyValueStore should be dropped. The store
 * calls these methods while holding its own lock, so implementations
 * don't need to do any locking of their own.
 */
template <class K> class EvictionPolicy {
public:

    virtual ~EvictionPolicy() { }

    /**
     * An entry was written.
     */
    virtual void inserted(const K& key, uint32_t nowMs) = 0;

    /**
     * An entry was read.
     */
    virtual void accessed(const K& key, uint32_t nowMs) { }

    /**
     * An entry left the store for any reason.
     */
    virtual void removed(const K& key) = 0;

    /**
     * Called after every insert and before every read.
     *
     * @param victims Receives the keys that should be dropped now.
     */
    virtual void collect(uint32_t nowMs, unsigned size, std::vector<K>& victims) = 0;
};

/**
 * Entries are dropped once they are older than a fixed age, measured
 * from the time they were written.
 */
template <class K> class TtlEviction : public EvictionPolicy<K> {
public:

    TtlEviction(uint32_t ttlMs) : _ttlMs(ttlMs) { }

    void inserted(const K& key, uint32_t nowMs) {
        _writeMs[key] = nowMs;
    }

    void removed(const K& key) {
        _writeMs.erase(key);
    }

    void collect(uint32_t nowMs, unsigned, std::vector<K>& victims) {
        for (const auto& [key, ms] : _writeMs)
            if (nowMs - ms > _ttlMs)
                victims.push_back(key);
    }

private:

    const uint32_t _ttlMs;
    std::map<K, uint32_t> _writeMs;
};

/**
 * Keeps at most maxEntries, dropping the least recently used first.
 */
template <class K> class LruEviction : public EvictionPolicy<K> {
public:

    LruEviction(unsigned maxEntries) : _maxEntries(maxEntries) { }

    void inserted(const K& key, uint32_t) {
        _touch(key);
    }

    void accessed(const K& key, uint32_t) {
        _touch(key);
    }

    void removed(const K& key) {
        auto it = _pos.find(key);
        if (it != _pos.end()) {
            _order.erase(it->second);
            _pos.erase(it);
        }
    }

    void collect(uint32_t, unsigned size, std::vector<K>& victims) {
        auto it = _order.rbegin();
        while (size > _maxEntries && it != _order.rend()) {
            victims.push_back(*it);
            it++;
            size--;
        }
    }

private:

    void _touch(const K& key) {
        removed(key);
        _order.push_front(key);
        _pos[key] = _order.begin();
    }

    const unsigned _maxEntries;
    // Most recent at the front
    std::list<K> _order;
    std::map<K, typename std::list<K>::iterator> _pos;
};

/**
 * A thread-safe map with a pluggable eviction policy. Used anywhere that
 * per-call state needs to be parked between events.
 */
template <class K, class V> class KeyValueStore {
public:

    /**
     * @param policy Optional, not owned. With no policy nothing is ever
     * evicted implicitly.
     */
    KeyValueStore(Clock& clock, EvictionPolicy<K>* policy = nullptr)
    :   _clock(clock), _policy(policy) { }

    void put(const K& key, const V& value) {
        std::lock_guard<std::mutex> guard(_lock);
        if (_policy)
            _policy->removed(key);
        _map[key] = value;
        if (_policy) {
            _policy->inserted(key, _clock.time());
            _evict();
        }
    }

    /**
     * @returns true if the key was found (value copied into out).
     */
    bool get(const K& key, V& out) {
        std::lock_guard<std::mutex> guard(_lock);
        _evict();
        auto it = _map.find(key);
        if (it == _map.end())
            return false;
        if (_policy)
            _policy->accessed(key, _clock.time());
        out = it->second;
        return true;
    }

    /**
     * Same as get() but the entry is removed.
     */
    bool take(const K& key, V& out) {
        std::lock_guard<std::mutex> guard(_lock);
        _evict();
        auto it = _map.find(key);
        if (it == _map.end())
            return false;
        out = it->second;
        _erase(key);
        return true;
    }

    /**
     * @returns true if something was removed.
     */
    bool remove(const K& key) {
        std::lock_guard<std::mutex> guard(_lock);
        if (_map.find(key) == _map.end())
            return false;
        _erase(key);
        return true;
    }

    unsigned size() {
        std::lock_guard<std::mutex> guard(_lock);
        _evict();
        return _map.size();
    }

    void clear() {
        std::lock_guard<std::mutex> guard(_lock);
        while (!_map.empty())
            _erase(_map.begin()->first);
    }

private:

    void _erase(const K& key) {
        _map.erase(key);
        if (_policy)
            _policy->removed(key);
    }

    void _evict() {
        if (!_policy)
            return;
        std::vector<K> victims;
        _policy->collect(_clock.time(), _map.size(), victims);
        for (const K& k : victims)
            _erase(k);
    }

    Clock& _clock;
    EvictionPolicy<K>* _policy;
    std::mutex _lock;
    std::map<K, V> _map;
};

    }
}
