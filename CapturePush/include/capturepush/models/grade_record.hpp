/** GradeRecord [CapturePush]
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

#ifndef GradeRecord_hpp
#define GradeRecord_hpp

#include <stdio.h>
#include <string>
#include <vector>

#include "capturepush/models/record.hpp"

class GradeRecord : public Record {
public:
    GradeRecord(nlohmann::json json);

    std::string kind();
    std::string identity();
    std::string displayName();
    std::vector<std::string> fieldNames();

    std::string term();
    std::string courseName();
    std::string courseCode();
    std::string score();
};

#endif /* GradeRecord_hpp */
