/** PollingScheduler [CapturePush]
 *
 * Runs every started target on its own worker thread. A cycle moves
 * through Fetching -> Diffing -> Dispatching and back to Idle; fetch
 * failures go through Backoff and are retried with exponential delays.
 * The first cycle runs immediately, later ones `interval +- jitter` after
 * the previous cycle ended.
 *
 * forceCycle() wakes the worker for an out-of-band cycle. Requests that
 * arrive while a cycle is running, or while a forced cycle is already
 * queued, share that cycle's result instead of starting another one.
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

#ifndef PollingScheduler_hpp
#define PollingScheduler_hpp

#include <stdio.h>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"

#include "capturepush/polling_target.hpp"

enum class TargetState {
    Idle,
    Fetching,
    Diffing,
    Dispatching,
    Backoff,
    Cancelled
};

std::string TargetStateToString(TargetState state);

enum class CycleStatus {
    Unchanged,      // fetched, nothing to report
    Baseline,       // first observation, stored without notifying
    Changed,        // changes were dispatched and the snapshot committed
    FetchFailed,    // fetch kept failing after all retries
    Failed,         // unexpected error inside the cycle
    Cancelled       // stopped before the cycle could commit
};

std::string CycleStatusToString(CycleStatus status);

struct CycleResult {
    std::string targetId;
    CycleStatus status;
    size_t changeCount;
    int attempts;
    bool forced;
    std::map<std::string, bool> deliveries;
    std::string error;

    nlohmann::json toJSON() const;
};

struct SchedulerOptions {
    int maxRetries;
    std::chrono::milliseconds backoffBase;
    std::chrono::milliseconds backoffMax;
    std::chrono::milliseconds phaseTimeout;

    SchedulerOptions();
};

typedef std::function<void(const CycleResult & result)> CycleListener;

class PollingScheduler {
    struct Worker;

    SchedulerOptions _options;
    std::shared_ptr<spdlog::logger> _logger;
    CycleListener _listener;

    std::mutex _mtx;
    std::map<std::string, std::shared_ptr<Worker>> _workers;

public:
    PollingScheduler(SchedulerOptions options, std::shared_ptr<spdlog::logger> logger, CycleListener listener = nullptr);
    ~PollingScheduler();

    // Throws GenericException if a target with the same id is running.
    // Without `immediate` the first cycle waits for the interval or a
    // forceCycle() call.
    void start(std::shared_ptr<PollingTarget> target, std::chrono::milliseconds interval, std::chrono::milliseconds jitter, bool immediate = true);

    // Throws GenericException if no target with this id was started.
    std::shared_future<CycleResult> forceCycle(std::string targetId);

    void stop(std::string targetId);
    void stopAll();

    TargetState state(std::string targetId);

    // Delay before retry number `attempt` (0 based): min(base * 2^attempt, max).
    static std::chrono::milliseconds backoffDelay(const SchedulerOptions & options, int attempt);

private:
    static void run(std::shared_ptr<Worker> worker, SchedulerOptions options, std::shared_ptr<spdlog::logger> logger, CycleListener listener);
    static CycleResult runCycle(std::shared_ptr<Worker> worker, bool forced, SchedulerOptions options, std::shared_ptr<spdlog::logger> logger);
    void signalStop(std::shared_ptr<Worker> worker);
    void awaitExit(std::shared_ptr<Worker> worker, std::chrono::milliseconds timeout);
};

#endif /* PollingScheduler_hpp */
