/** ChannelConfig [CapturePush]
 */

/* LICENSE
* Copyright (C) 2017-2021 Foundry 376.
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
* along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef ChannelConfig_hpp
#define ChannelConfig_hpp

#include <stdio.h>
#include <map>
#include <string>

#include "nlohmann/json.hpp"

class ChannelConfig {
public:
    std::string name;
    bool enabled;
    std::map<std::string, std::string> parameters;

    ChannelConfig();
    ChannelConfig(std::string name, bool enabled, std::map<std::string, std::string> parameters);

    // Throws GenericException when the entry has no name.
    static ChannelConfig FromJSON(const nlohmann::json & json);

    // parameters["type"], or the channel name when no type is given.
    std::string type() const;

    std::string parameter(const std::string & key, std::string fallback = "") const;
    bool hasParameter(const std::string & key) const;

    nlohmann::json toJSON() const;
};

#endif /* ChannelConfig_hpp */
