/** Snapshot [CapturePush]
 *
 * All records of one kind observed for an account at `capturedAt`.
 * Records are kept in the order the adapter returned them. Identities are
 * unique: when the adapter returns the same identity twice, the first
 * occurrence wins and the duplicate is logged and dropped.
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

#ifndef Snapshot_hpp
#define Snapshot_hpp

#include <stdio.h>
#include <time.h>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"

#include "capturepush/models/record.hpp"

class Snapshot {
    std::string _kind;
    std::string _accountKey;
    time_t _capturedAt;
    std::vector<std::shared_ptr<Record>> _records;
    std::map<std::string, std::shared_ptr<Record>> _byIdentity;
    int _duplicates;

public:
    Snapshot(std::string kind, std::string accountKey, std::vector<std::shared_ptr<Record>> records, time_t capturedAt, std::shared_ptr<spdlog::logger> logger = nullptr);

    // Throws GenericException if `records` is not an array or one of its
    // items is not a valid record of `kind`.
    static std::shared_ptr<Snapshot> FromJSON(std::string kind, std::string accountKey, const nlohmann::json & records, time_t capturedAt, std::shared_ptr<spdlog::logger> logger = nullptr);

    std::string kind() const;
    std::string accountKey() const;
    time_t capturedAt() const;
    int duplicatesDropped() const;

    const std::vector<std::shared_ptr<Record>> & records() const;
    const std::map<std::string, std::shared_ptr<Record>> & recordsByIdentity() const;
    std::shared_ptr<Record> find(const std::string & identity) const;
    size_t size() const;

    nlohmann::json recordsJSON() const;
    nlohmann::json toJSON() const;
};

#endif /* Snapshot_hpp */
