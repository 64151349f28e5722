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

#include <mutex>
#include <atomic>
#include <thread>
#include <memory>
#include <string>
#include <functional>

#include <nlohmann/json.hpp>

#include "kc1fsz-tools/threadsafequeue2.h"

#include "gwbridge/Directory.h"

namespace kc1fsz {

class Log;

    namespace gwbridge {

/**
 * A Directory that is backed by a JSON document of the form:
 *
 *   { "gateways": [ ... ], "contacts": [ ... ], "rules": [ ... ] }
 *
 * The document can be replaced at any time (i.e. when the file changes).
 * All requests are served in order by one worker thread. Interaction
 * records are appended to a file, one JSON document per line.
 */
class JsonDirectory : public Directory {
public:

    /**
     * @param interactionLogFile Empty to disable interaction writing.
     */
    JsonDirectory(Log& log, const std::string& interactionLogFile);
    ~JsonDirectory();

    /**
     * Replaces the whole document. Malformed entries are logged and
     * skipped, the rest are kept.
     */
    void load(const nlohmann::json& doc);

    unsigned gatewayCount();
    unsigned ruleCount();

    // ----- Directory --------------------------------------------------------

    std::future<std::optional<GatewayDevice>> findGateway(const std::string& gatewayId);
    std::future<std::optional<Contact>> findContact(const std::string& orgId,
        const std::string& phone);
    std::future<std::optional<Contact>> findContactByPhone(const std::string& phone);
    std::future<std::vector<RoutingRule>> activeRules(const std::string& orgId);
    std::future<void> appendInteraction(const InteractionRecord& rec);

    /**
     * @returns false if the rule is malformed (reason in err).
     */
    static bool parseRule(const nlohmann::json& j, RoutingRule& rule, std::string& err);
    static bool parseGateway(const nlohmann::json& j, GatewayDevice& dev, std::string& err);

private:

    struct Snapshot {
        std::vector<GatewayDevice> gateways;
        std::vector<Contact> contacts;
        std::vector<RoutingRule> rules;
    };

    template <class T> std::future<T> _submit(std::function<T(const Snapshot&)> fn);

    std::shared_ptr<const Snapshot> _current();
    void _writeInteraction(const InteractionRecord& rec);
    void _loop();

    Log& _log;
    const std::string _interactionLogFile;

    std::mutex _lock;
    std::shared_ptr<const Snapshot> _data;

    threadsafequeue2<std::function<void()>> _jobs;
    std::atomic<bool> _run;
    std::thread _worker;
};

    }
}
