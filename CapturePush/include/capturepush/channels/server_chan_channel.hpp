/** ServerChanChannel [CapturePush]
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

#ifndef ServerChanChannel_hpp
#define ServerChanChannel_hpp

#include <stdio.h>
#include <memory>
#include <string>

#include "spdlog/spdlog.h"

#include "capturepush/notification_channel.hpp"

#define SERVERCHAN_BASE_URL "https://sctapi.ftqq.com/"

class ServerChanChannel : public NotificationChannel {
    std::string _sendKey;
    std::string _baseUrl;
    long _timeoutSeconds;
    std::shared_ptr<spdlog::logger> _logger;

public:
    ServerChanChannel(std::string sendKey, long timeoutSeconds, std::shared_ptr<spdlog::logger> logger, std::string baseUrl = SERVERCHAN_BASE_URL);

    bool send(std::string subject, std::string content) override;

    std::string endpoint();
    std::string formBody(std::string subject, std::string content);
};

#endif /* ServerChanChannel_hpp */
