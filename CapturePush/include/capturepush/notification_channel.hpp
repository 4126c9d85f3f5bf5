/** NotificationChannel [CapturePush]
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

#ifndef NotificationChannel_hpp
#define NotificationChannel_hpp

#include <string>

class NotificationChannel {
public:
    virtual ~NotificationChannel() {}

    // Returns true when the message was accepted by the remote service.
    // Implementations may throw; the dispatcher records that as a failure.
    virtual bool send(std::string subject, std::string content) = 0;
};

#endif /* NotificationChannel_hpp */
