/** Record [CapturePush]
 *
 * A single semi-structured row returned by a SchoolAdapter. The JSON
 * document is kept verbatim in `_data` so that every field round-trips
 * through the StateStore; subclasses only add an identity and the list
 * of fields that are rendered in notifications.
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

#ifndef Record_hpp
#define Record_hpp

#include <stdio.h>
#include <memory>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

#define RECORD_KIND_GRADES      "grades"
#define RECORD_KIND_SCHEDULE    "schedule"

class Record {
public:
    nlohmann::json _data;

    Record(nlohmann::json json);
    virtual ~Record();

    virtual std::string kind() = 0;

    // Key that is unique within one snapshot of this kind.
    virtual std::string identity() = 0;

    // Short human readable label, used in notification text.
    virtual std::string displayName() = 0;

    // Fields that are shown in notifications, in display order.
    virtual std::vector<std::string> fieldNames() = 0;

    virtual nlohmann::json normalizedValue(const std::string & field);

    // Every field of the record with its value normalized for comparison.
    nlohmann::json normalized();

    // Value of a field as it should appear in a message ("" if absent).
    std::string textValue(const std::string & field);

    virtual nlohmann::json toJSON();
};

// Builds the Record subclass for `kind`. Throws GenericException if the
// document is not an object or lacks the fields its identity is built from.
std::shared_ptr<Record> RecordFromJSON(std::string kind, const nlohmann::json & json);

#endif /* Record_hpp */
