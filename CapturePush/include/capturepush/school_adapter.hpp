/** SchoolAdapter [CapturePush]
 *
 * Fetches raw records for one institution. A nullptr result means the
 * fetch failed and must never be treated as "no records"; an empty vector
 * is a confirmed empty result. Implementations may also throw
 * SyncException to say whether the failure is worth retrying.
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

#ifndef SchoolAdapter_hpp
#define SchoolAdapter_hpp

#include <stdio.h>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

struct Credentials {
    std::string username;
    std::string password;
};

typedef std::shared_ptr<std::vector<nlohmann::json>> RecordList;

class SchoolAdapter {
public:
    virtual ~SchoolAdapter() {}

    virtual std::string schoolCode() = 0;
    virtual std::string schoolName() = 0;

    virtual RecordList fetchGrades(const Credentials & credentials, bool forceUpdate) = 0;
    virtual RecordList fetchCourseSchedule(const Credentials & credentials, bool forceUpdate) = 0;
};

typedef std::function<std::shared_ptr<SchoolAdapter>()> SchoolAdapterFactory;

#endif /* SchoolAdapter_hpp */
