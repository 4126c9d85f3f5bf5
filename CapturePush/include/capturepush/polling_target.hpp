/** PollingTarget [CapturePush]
 *
 * One unit of work driven by the PollingScheduler, split into the phases
 * the scheduler can observe and cancel between. A target is only ever
 * driven by its own worker thread, so phases of one target never overlap.
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

#ifndef PollingTarget_hpp
#define PollingTarget_hpp

#include <stdio.h>
#include <map>
#include <string>

struct DiffOutcome {
    bool firstObservation;
    size_t changeCount;
};

class PollingTarget {
public:
    virtual ~PollingTarget() {}

    virtual std::string targetId() = 0;

    // Fetches fresh data. Throws SyncException when the fetch failed,
    // including when the adapter produced no result at all.
    virtual void fetch(bool forceUpdate) = 0;

    // Diffs the fetched data against the stored snapshot.
    virtual DiffOutcome detectChanges() = 0;

    // Notifies about the detected changes (if any) and then persists the
    // fetched snapshot. Returns the per-channel delivery results.
    virtual std::map<std::string, bool> dispatchAndCommit() = 0;

    // Drops fetched data of a cycle that will not be committed.
    virtual void discard() = 0;
};

#endif /* PollingTarget_hpp */
