/** AdapterDescriptor [CapturePush]
 *
 * Describes one installable school adapter. Built from an entry of the
 * remote plugin index (or its local cache) and persisted next to an
 * installed module as descriptor.json.
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

#ifndef AdapterDescriptor_hpp
#define AdapterDescriptor_hpp

#include <stdio.h>
#include <string>

#include "nlohmann/json.hpp"

class AdapterDescriptor {
public:
    std::string code;
    std::string displayName;
    std::string version;
    std::string downloadUrl;
    std::string contentHash;
    std::string localPath;

    AdapterDescriptor();
    AdapterDescriptor(std::string code, std::string displayName, std::string version, std::string downloadUrl, std::string contentHash);

    // Accepts both the current index keys (display_name, version, sha256)
    // and the legacy ones (school_name, plugin_version, content_hash).
    // Throws GenericException if `entry` is not an object.
    static AdapterDescriptor FromIndexEntry(std::string code, const nlohmann::json & entry);

    static AdapterDescriptor FromJSON(const nlohmann::json & json);

    nlohmann::json toJSON() const;
};

#endif /* AdapterDescriptor_hpp */
