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
#include <vector>

#include <nlohmann/json.hpp>

namespace kc1fsz {
    namespace gwbridge {

/**
 * @returns true if the name is one of the upstream's prebuilt voices.
 */
bool isKnownVoice(const std::string& name);

/**
 * @returns All prebuilt voice names, in catalog order.
 */
const std::vector<std::string>& voiceNames();

/**
 * @returns true if there is a declaration for the named tool.
 */
bool isKnownTool(const std::string& name);

/**
 * Builds the array of function declarations that is advertised upstream
 * during session setup.
 *
 * @throws ConfigurationError if any name is unknown.
 */
nlohmann::json toolDeclarations(const std::vector<std::string>& names);

    }
}
