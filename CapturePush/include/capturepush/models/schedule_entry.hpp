/** ScheduleEntry [CapturePush]
 *
 * One weekly slot of a course. `week_list` is either an array of week
 * numbers or the string "all" for every week of the semester.
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

#ifndef ScheduleEntry_hpp
#define ScheduleEntry_hpp

#include <stdio.h>
#include <string>
#include <vector>

#include "capturepush/models/record.hpp"

#define WEEK_LIST_ALL "all"

class ScheduleEntry : public Record {
public:
    ScheduleEntry(nlohmann::json json);

    std::string kind();
    std::string identity();
    std::string displayName();
    std::vector<std::string> fieldNames();

    nlohmann::json normalizedValue(const std::string & field);

    int weekday();
    int startPeriod();
    int endPeriod();
    std::string courseName();
    std::string room();
    std::string teacher();

    bool allWeeks();
    // Sorted, de-duplicated week numbers. Empty when allWeeks() is true.
    std::vector<int> weeks();

private:
    int intValue(const std::string & field, int fallback);
};

#endif /* ScheduleEntry_hpp */
