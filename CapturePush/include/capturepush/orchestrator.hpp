/** Orchestrator [CapturePush]
 *
 * Wires configured accounts to adapters, the state store and the
 * notification channels, and drives them through a PollingScheduler. It
 * is the only component that reads the AppConfig. Everything it needs is
 * passed in through the AppContext built once by main().
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

#ifndef Orchestrator_hpp
#define Orchestrator_hpp

#include <stdio.h>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"

#include "capturepush/channel_factory.hpp"
#include "capturepush/models/app_config.hpp"
#include "capturepush/notification_dispatcher.hpp"
#include "capturepush/plugin_registry.hpp"
#include "capturepush/polling_scheduler.hpp"
#include "capturepush/state_store.hpp"

struct AppContext {
    std::shared_ptr<AppConfig> config;
    std::shared_ptr<spdlog::logger> logger;
    std::shared_ptr<PluginRegistry> registry;
    std::shared_ptr<StateStore> store;
    std::shared_ptr<NotificationDispatcher> dispatcher;
    std::shared_ptr<ChannelFactory> channels;
};

class Orchestrator {
    AppContext _ctx;
    std::unique_ptr<PollingScheduler> _scheduler;
    std::vector<std::string> _targetIds;

    std::mutex _skippedMtx;
    std::map<std::string, nlohmann::json> _skipped;

public:
    Orchestrator(AppContext ctx);
    ~Orchestrator();

    // Registers channels, resolves adapters and starts one polling target
    // per enabled (account, kind). Accounts whose adapter cannot be
    // resolved are logged and skipped.
    void start();

    // Runs one forced cycle for every target and waits for all of them.
    std::vector<CycleResult> runOnce();

    void stop();

    std::vector<std::string> targetIds();

    // accountKey -> error of every account that was skipped.
    nlohmann::json skippedAccounts();

private:
    void registerChannels();
    void startTargets(bool immediate);
    void onCycle(const CycleResult & result);
};

#endif /* Orchestrator_hpp */
