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

#include <map>
#include <mutex>
#include <string>
#include <functional>

#include <nlohmann/json.hpp>

#include "gwbridge/StreamingTransport.h"

namespace kc1fsz {

class Log;

    namespace gwbridge {

class Directory;

/**
 * Runs the function calls that the upstream agent makes in the middle of
 * a conversation. Handlers are registered by tool name.
 *
 * execute() never throws. Problems are reported back to the agent as an
 * {"error": ...} result so that it can tell the caller.
 */
class ToolExecutor {
public:

    typedef std::function<nlohmann::json(const nlohmann::json& args)> Handler;

    ToolExecutor(Log& log);

    void registerHandler(const std::string& name, Handler handler);

    /**
     * Registers the standard tools (lookup_account, transfer_to_human).
     *
     * @param dir Used for account lookups, not owned.
     */
    void registerStandardTools(Directory& dir, unsigned lookupTimeoutMs);

    ToolResult execute(const ToolCall& call);

private:

    Log& _log;
    std::mutex _lock;
    std::map<std::string, Handler> _handlers;
};

    }
}
