/** NotificationDispatcher [CapturePush]
 *
 * Holds the registered channels and fans one rendered message out to every
 * enabled channel. Each channel's send runs on its own thread so a slow or
 * failing channel cannot hold up or break the others. dispatch() never
 * throws: exceptions, false returns and timeouts become `false` entries.
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

#ifndef NotificationDispatcher_hpp
#define NotificationDispatcher_hpp

#include <stdio.h>
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "spdlog/spdlog.h"

#include "capturepush/notification_channel.hpp"

class NotificationDispatcher {
    struct Registration {
        std::shared_ptr<NotificationChannel> channel;
        bool enabled;
        // sends that timed out and are still running in the background
        std::shared_ptr<std::atomic<int>> abandoned;
    };

    std::mutex _mtx;
    std::map<std::string, Registration> _channels;
    std::chrono::milliseconds _timeout;
    std::shared_ptr<spdlog::logger> _logger;

public:
    NotificationDispatcher(std::shared_ptr<spdlog::logger> logger, std::chrono::milliseconds timeout);

    // Re-registering a name replaces the previous channel. Throws
    // LoadException if `channel` is null.
    void registerChannel(std::string name, std::shared_ptr<NotificationChannel> channel, bool enabled = true);

    // Returns false if no channel is registered under `name`.
    bool setEnabled(std::string name, bool enabled);

    bool isEnabled(std::string name);
    std::vector<std::string> channelNames();

    // Sends to every enabled channel in parallel and waits at most the
    // timeout. A channel with a send that timed out and has not returned yet
    // is not called again and is recorded as failed. Never throws.
    std::map<std::string, bool> dispatch(std::string subject, std::string content);
};

#endif /* NotificationDispatcher_hpp */
