/** ChangeDetector [CapturePush]
 *
 * Structural diff of two snapshots of the same kind. Records are matched by
 * identity and compared field by field on their normalized values, so
 * whitespace noise and number/string formatting differences never produce
 * events. Output order is added, removed, modified, each group sorted by
 * identity.
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

#ifndef ChangeDetector_hpp
#define ChangeDetector_hpp

#include <stdio.h>
#include <memory>
#include <vector>

#include "capturepush/models/change_event.hpp"
#include "capturepush/models/snapshot.hpp"

class ChangeDetector {
public:
    // A null `previous` is a first observation and yields no events.
    static std::vector<ChangeEvent> diff(const std::shared_ptr<Snapshot> & previous, const std::shared_ptr<Snapshot> & current);

    static std::shared_ptr<Snapshot> apply(const std::shared_ptr<Snapshot> & previous, const std::vector<ChangeEvent> & changes);
};

#endif /* ChangeDetector_hpp */
