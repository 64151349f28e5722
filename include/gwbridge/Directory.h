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

#include <future>
#include <string>
#include <vector>
#include <optional>

#include <nlohmann/json.hpp>

#include "gwbridge/Routing.h"

namespace kc1fsz {
    namespace gwbridge {

/**
 * One row of the interaction history.
 */
struct InteractionRecord {
    std::string orgId;
    std::string contactId;
    std::string type;
    std::string status;
    // Wall-clock seconds since the epoch
    uint64_t startedAt = 0;
    nlohmann::json metadata;
};

/**
 * The abstract interface to the persistence collaborator. Every call
 * returns immediately with a future. The work happens somewhere else,
 * so callers decide for themselves how long they are willing to wait.
 *
 * A failed lookup is reported through the future (i.e. get() throws).
 */
class Directory {
public:

    virtual ~Directory() { }

    /**
     * @returns Empty if no device is registered under that id. Inactive
     * devices are returned with isActive false.
     */
    virtual std::future<std::optional<GatewayDevice>> findGateway(const std::string& gatewayId) = 0;

    virtual std::future<std::optional<Contact>> findContact(const std::string& orgId,
        const std::string& phone) = 0;

    /**
     * Any phone number in any organization. Used by the account lookup tool.
     */
    virtual std::future<std::optional<Contact>> findContactByPhone(const std::string& phone) = 0;

    /**
     * @returns The organization's active rules, in no particular order.
     */
    virtual std::future<std::vector<RoutingRule>> activeRules(const std::string& orgId) = 0;

    virtual std::future<void> appendInteraction(const InteractionRecord& rec) = 0;
};

    }
}
