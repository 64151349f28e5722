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

#include <filesystem>
#include <functional>
#include <string>

#include <nlohmann/json.hpp>

#include "Runnable2.h"

namespace kc1fsz {

class Log;

    namespace gwbridge {

/**
 * Polls a JSON file and fires a callback any time it changes. The
 * callback is fired on the first tick as well.
 */
class FilePoller : public Runnable2 {
public:

    /**
     * @param changeCb Called every time the document changes, on the
     * thread that drives oneSecTick().
     */
    FilePoller(Log& log, const std::string& fileName,
        std::function<void(const nlohmann::json& doc)> changeCb);

    /**
     * Checks the file now.
     *
     * @returns true if the callback was fired.
     */
    bool check();

    unsigned loadCount() const { return _loadCount; }

    // ----- Runnable2 --------------------------------------------------------

    bool run2() { return false; }
    void oneSecTick() { check(); }

private:

    Log& _log;
    std::string _fn;
    std::function<void(const nlohmann::json& doc)> _cb;
    std::filesystem::file_time_type _lastUpdate;
    bool _startup = true;
    bool _loadErrorDisplayed = false;
    unsigned _loadCount = 0;
};

    }
}
