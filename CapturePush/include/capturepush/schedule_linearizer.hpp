/** ScheduleLinearizer [CapturePush]
 *
 * Rearranges a weekly course schedule into one list of courses per
 * semester week. Entries that cover "all" weeks are expanded to every
 * week of the semester. Within a week, slots of the same course on the
 * same day whose periods are strictly consecutive are merged into one.
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

#ifndef ScheduleLinearizer_hpp
#define ScheduleLinearizer_hpp

#include <stdio.h>
#include <time.h>
#include <string>

#include "nlohmann/json.hpp"

#include "capturepush/models/snapshot.hpp"

class ScheduleLinearizer {
    int _semesterWeeks;
    std::string _firstMonday;
    time_t _firstMondayTime;

public:
    // Throws GenericException if `firstMonday` is set but not a YYYY-MM-DD date.
    ScheduleLinearizer(int semesterWeeks, std::string firstMonday = "");

    nlohmann::json linearize(const Snapshot & schedule, time_t generatedAt);

    // Calendar date of `weekday` (1 = Monday) in semester week `week`, or
    // "" when no first Monday is known.
    std::string dateFor(int week, int weekday);
};

#endif /* ScheduleLinearizer_hpp */
