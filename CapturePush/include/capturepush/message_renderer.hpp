/** MessageRenderer [CapturePush]
 *
 * Turns a change list into the subject and body handed to every
 * notification channel. Both are pure functions of their arguments.
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

#ifndef MessageRenderer_hpp
#define MessageRenderer_hpp

#include <stdio.h>
#include <string>
#include <vector>

#include "capturepush/models/change_event.hpp"

class MessageRenderer {
public:
    static std::string subject(std::string kind, const std::vector<ChangeEvent> & changes);
    static std::string content(std::string kind, const std::vector<ChangeEvent> & changes);

    static std::string describe(const ChangeEvent & change);
};

#endif /* MessageRenderer_hpp */
