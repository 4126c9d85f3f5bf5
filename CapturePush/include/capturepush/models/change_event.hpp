/** ChangeEvent [CapturePush]
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

#ifndef ChangeEvent_hpp
#define ChangeEvent_hpp

#include <stdio.h>
#include <memory>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

#include "capturepush/models/record.hpp"

enum class ChangeKind {
    Added,
    Removed,
    Modified
};

std::string ChangeKindToString(ChangeKind kind);

struct FieldChange {
    std::string field;
    std::string before;
    std::string after;
};

class ChangeEvent {
public:
    ChangeKind kind;
    std::string identity;
    std::shared_ptr<Record> before;
    std::shared_ptr<Record> after;

    // Throws GenericException when both before and after are null.
    ChangeEvent(ChangeKind kind, std::string identity, std::shared_ptr<Record> before, std::shared_ptr<Record> after);

    // The record that is present (after for Added/Modified, before for Removed).
    std::shared_ptr<Record> subject() const;

    // Fields whose normalized values differ. Only meaningful for Modified.
    std::vector<FieldChange> fieldChanges() const;

    nlohmann::json toJSON() const;
};

#endif /* ChangeEvent_hpp */
