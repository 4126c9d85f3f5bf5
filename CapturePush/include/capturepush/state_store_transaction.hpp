/** StateStoreTransaction [CapturePush]
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

#ifndef StateStoreTransaction_hpp
#define StateStoreTransaction_hpp

#include <chrono>
#include <string>

#include "spdlog/spdlog.h"

#include "capturepush/state_store.hpp"

class StateStoreTransaction
{
public:
    /**
     * @brief Begins the SQLite transaction
     *
     * @param[in] database the SnapshotDatabase, whose mutex the caller holds
     *
     * Exception is thrown in case of error, then the Transaction is NOT initiated.
     */
    explicit StateStoreTransaction(SnapshotDatabase * database, std::shared_ptr<spdlog::logger> logger, std::string nameHint = "");

    /**
     * @brief Safely rollback the transaction if it has not been committed.
     */
    virtual ~StateStoreTransaction() noexcept; // nothrow

    /**
     * @brief Commit the transaction.
     */
    void commit();

private:
    // Transaction must be non-copyable
    StateStoreTransaction(const StateStoreTransaction&);
    StateStoreTransaction& operator=(const StateStoreTransaction&);

private:
    SnapshotDatabase* mDatabase;
    std::shared_ptr<spdlog::logger> mLogger;
    bool mCommited;  // < True when commit has been called
    std::chrono::system_clock::time_point mStart;
    std::string mNameHint;
};

#endif
