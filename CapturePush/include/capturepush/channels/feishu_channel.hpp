/** FeishuChannel [CapturePush]
 *
 * Posts a text message to a Feishu (Lark) custom bot webhook. When the bot
 * has signature verification enabled, `secret` must be set and every
 * request carries a timestamp and its HMAC-SHA256 signature.
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

#ifndef FeishuChannel_hpp
#define FeishuChannel_hpp

#include <stdio.h>
#include <memory>
#include <string>

#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"

#include "capturepush/notification_channel.hpp"

class FeishuChannel : public NotificationChannel {
    std::string _webhookUrl;
    std::string _secret;
    long _timeoutSeconds;
    std::shared_ptr<spdlog::logger> _logger;

public:
    FeishuChannel(std::string webhookUrl, std::string secret, long timeoutSeconds, std::shared_ptr<spdlog::logger> logger);

    bool send(std::string subject, std::string content) override;

    nlohmann::json payload(std::string subject, std::string content, time_t timestamp);

    // base64(HMAC-SHA256(key = "<timestamp>\n<secret>", message = "")), as
    // required by the Feishu bot signature check.
    static std::string signature(std::string timestamp, std::string secret);
};

#endif /* FeishuChannel_hpp */
