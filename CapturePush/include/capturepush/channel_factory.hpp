/** ChannelFactory [CapturePush]
 *
 * Creates NotificationChannels from ChannelConfig entries. The webhook
 * based channels are registered by default; other transports (email) are
 * registered by the executable with registerType().
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

#ifndef ChannelFactory_hpp
#define ChannelFactory_hpp

#include <stdio.h>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "spdlog/spdlog.h"

#include "capturepush/models/channel_config.hpp"
#include "capturepush/notification_channel.hpp"

typedef std::function<std::shared_ptr<NotificationChannel>(const ChannelConfig & config)> ChannelConstructor;

class ChannelFactory {
    std::map<std::string, ChannelConstructor> _constructors;
    std::shared_ptr<spdlog::logger> _logger;
    long _timeoutSeconds;

public:
    ChannelFactory(std::shared_ptr<spdlog::logger> logger, long timeoutSeconds);

    void registerType(std::string type, ChannelConstructor constructor);
    std::vector<std::string> types();

    // Throws LoadException for an unknown type or a missing required parameter.
    std::shared_ptr<NotificationChannel> create(const ChannelConfig & config);

    // Returns the parameter value or throws LoadException naming the channel.
    static std::string requireParameter(const ChannelConfig & config, std::string key);

    // Parses an optional integer parameter. Throws LoadException when the
    // value is not a whole number in [min, max].
    static long integerParameter(const ChannelConfig & config, std::string key, long defaultValue, long min, long max);
};

#endif /* ChannelFactory_hpp */
