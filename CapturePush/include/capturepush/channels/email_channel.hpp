/** EmailChannel [CapturePush]
 *
 * Sends the message as a plain text email through an SMTP relay using
 * mailcore2. Port 465 uses implicit TLS, port 25 is sent in the clear and
 * every other port negotiates STARTTLS.
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

#ifndef EmailChannel_hpp
#define EmailChannel_hpp

#include <stdio.h>
#include <memory>
#include <string>

#include "spdlog/spdlog.h"

#include "capturepush/notification_channel.hpp"

class EmailChannel : public NotificationChannel {
    std::string _host;
    int _port;
    std::string _sender;
    std::string _password;
    std::string _receiver;
    long _timeoutSeconds;
    std::shared_ptr<spdlog::logger> _logger;

public:
    EmailChannel(std::string host, int port, std::string sender, std::string password, std::string receiver, long timeoutSeconds, std::shared_ptr<spdlog::logger> logger);

    bool send(std::string subject, std::string content) override;
};

#endif /* EmailChannel_hpp */
