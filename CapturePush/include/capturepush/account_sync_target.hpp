/** AccountSyncTarget [CapturePush]
 *
 * The PollingTarget for one (account, kind) pair: fetches records through
 * the school adapter, diffs them against the StateStore, notifies through
 * the dispatcher and commits the new snapshot. A first observation is
 * stored without notifying.
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

#ifndef AccountSyncTarget_hpp
#define AccountSyncTarget_hpp

#include <stdio.h>
#include <memory>
#include <string>
#include <vector>

#include "spdlog/spdlog.h"

#include "capturepush/models/app_config.hpp"
#include "capturepush/models/change_event.hpp"
#include "capturepush/models/snapshot.hpp"
#include "capturepush/notification_dispatcher.hpp"
#include "capturepush/polling_target.hpp"
#include "capturepush/school_adapter.hpp"
#include "capturepush/state_store.hpp"

class AccountSyncTarget : public PollingTarget {
    AccountConfig _account;
    std::string _kind;
    std::shared_ptr<SchoolAdapter> _adapter;
    std::shared_ptr<StateStore> _store;
    std::shared_ptr<NotificationDispatcher> _dispatcher;
    std::shared_ptr<spdlog::logger> _logger;

    std::shared_ptr<Snapshot> _fetched;
    std::shared_ptr<Snapshot> _previous;
    std::vector<ChangeEvent> _changes;

public:
    AccountSyncTarget(AccountConfig account, std::string kind, std::shared_ptr<SchoolAdapter> adapter, std::shared_ptr<StateStore> store, std::shared_ptr<NotificationDispatcher> dispatcher, std::shared_ptr<spdlog::logger> logger);

    std::string targetId() override;
    std::string kind();

    void fetch(bool forceUpdate) override;
    DiffOutcome detectChanges() override;
    std::map<std::string, bool> dispatchAndCommit() override;
    void discard() override;
};

#endif /* AccountSyncTarget_hpp */
