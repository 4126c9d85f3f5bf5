/** PluginException [CapturePush]
 *
 * Errors raised by the PluginRegistry. They abort only the install or
 * resolve call that raised them and always carry the institution code.
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

#ifndef PluginException_hpp
#define PluginException_hpp

#include <stdio.h>
#include <string>

#include "nlohmann/json.hpp"
#include "capturepush/generic_exception.hpp"


class PluginException : public GenericException {
public:
    PluginException(std::string type, std::string code, std::string di);
    std::string type;
    std::string code;
    std::string debuginfo;
    nlohmann::json toJSON();
};

// The downloaded artifact's digest does not match the index.
class IntegrityException : public PluginException {
public:
    IntegrityException(std::string code, std::string expected, std::string actual);
    std::string expected;
    std::string actual;
};

// Unknown institution code, or an adapter that was never installed.
class NotFoundException : public PluginException {
public:
    NotFoundException(std::string code, std::string di);
};

// The module could not be loaded or does not export the required functions.
class LoadException : public PluginException {
public:
    LoadException(std::string code, std::string di);
};

#endif /* PluginException_hpp */
