/** StateStore [CapturePush]
 *
 * Persists the last observed Snapshot for each (account key, kind). Every
 * pair gets its own SQLite file under the state directory so that targets
 * never contend for a lock. A snapshot is replaced inside a transaction,
 * so readers see either the previous snapshot or the new one.
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

#ifndef StateStore_hpp
#define StateStore_hpp

#include <stdio.h>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "SQLiteCpp/SQLiteCpp.h"
#include "spdlog/spdlog.h"

#include "capturepush/models/snapshot.hpp"

class SnapshotDatabase {
    SQLite::Database _db;
    SQLite::Statement _stmtBeginTransaction;
    SQLite::Statement _stmtRollbackTransaction;
    SQLite::Statement _stmtCommitTransaction;

public:
    std::mutex mtx;

    SnapshotDatabase(std::string path);

    void migrate();

    SQLite::Database & db();

    void beginTransaction();
    void rollbackTransaction();
    void commitTransaction();
};

class StateStore {
    std::string _root;
    std::shared_ptr<spdlog::logger> _logger;

    std::mutex _databasesMtx;
    std::map<std::string, std::shared_ptr<SnapshotDatabase>> _databases;

public:
    StateStore(std::string root, std::shared_ptr<spdlog::logger> logger);

    std::string pathFor(std::string accountKey, std::string kind);

    // Returns nullptr when nothing was saved yet, or when the stored row
    // holds data that no longer parses (the problem is logged). Throws
    // SQLite::Exception when the database cannot be opened or queried, so
    // an unreadable baseline is never mistaken for a missing one.
    std::shared_ptr<Snapshot> load(std::string accountKey, std::string kind);

    // Replaces the stored snapshot for (snapshot.accountKey(), snapshot.kind()).
    // Throws SQLite::Exception if the write fails; the previous snapshot is
    // left untouched in that case.
    void save(const Snapshot & snapshot);

private:
    std::shared_ptr<SnapshotDatabase> databaseFor(std::string accountKey, std::string kind, bool create);
};

#endif /* StateStore_hpp */
