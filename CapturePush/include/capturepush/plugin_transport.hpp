/** PluginTransport [CapturePush]
 *
 * How the PluginRegistry reaches the plugin index and artifacts. The curl
 * implementation is used in production; tests substitute their own.
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

#ifndef PluginTransport_hpp
#define PluginTransport_hpp

#include <string>

class PluginTransport {
public:
    virtual ~PluginTransport() {}

    // Returns the response body. Throws SyncException on failure.
    virtual std::string download(std::string url) = 0;
};

class CurlPluginTransport : public PluginTransport {
    long _timeoutSeconds;

public:
    CurlPluginTransport(long timeoutSeconds = 120);

    std::string download(std::string url);
};

#endif /* PluginTransport_hpp */
