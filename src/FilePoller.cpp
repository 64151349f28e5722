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
#include <fstream>
#include <sstream>

#include "kc1fsz-tools/Log.h"

#include "FilePoller.h"

using namespace std;
using json = nlohmann::json;

namespace kc1fsz {
    namespace gwbridge {

FilePoller::FilePoller(Log& log, const string& fileName,
    std::function<void(const json& doc)> cb)
:   _log(log),
    _fn(fileName),
    _cb(cb) {
}

bool FilePoller::check() {
    try {
        auto ftime = std::filesystem::last_write_time(_fn);
        if (!_startup && ftime <= _lastUpdate)
            return false;
        _lastUpdate = ftime;
        _startup = false;
        ifstream f(_fn);
        std::stringstream buffer;
        buffer << f.rdbuf();
        f.close();
        try {
            json j = json::parse(buffer.str());
            _loadErrorDisplayed = false;
            _loadCount++;
            _cb(j);
            return true;
        } catch (const json::exception& ex) {
            _log.error("Invalid file format %s: %s", _fn.c_str(), ex.what());
        }
    } catch (const std::filesystem::filesystem_error& ex) {
        // Only complain once until the file shows up again
        if (!_loadErrorDisplayed) {
            _log.error("Unable to load %s: %s", _fn.c_str(), ex.what());
            _loadErrorDisplayed = true;
        }
    }
    return false;
}

    }
}
