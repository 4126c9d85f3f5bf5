/** AppConfig [CapturePush]
 *
 * The validated configuration document. Parsing never throws: missing keys
 * fall back to the documented defaults and type errors are collected, so
 * the caller checks valid() and reports errors() before using the config.
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

#ifndef AppConfig_hpp
#define AppConfig_hpp

#include <stdio.h>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

#include "capturepush/models/channel_config.hpp"

struct TargetConfig {
    bool enabled;
    int interval;
};

class AccountConfig {
public:
    std::string id;
    std::string schoolCode;
    std::string username;
    std::string password;
    TargetConfig grades;
    TargetConfig schedule;

    // Unique key of the account across institutions: "<school_code>-<username>".
    std::string accountKey() const;
};

class AppConfig {
    std::vector<std::string> _errors;

public:
    std::vector<AccountConfig> accounts;
    std::vector<ChannelConfig> channels;

    int jitter;
    int maxRetries;
    int backoffBase;
    int backoffMax;
    int phaseTimeout;
    int dispatchTimeout;

    std::string pluginIndexUrl;
    bool autoUpdatePlugins;

    std::string firstMonday;
    int semesterWeeks;

    AppConfig();
    AppConfig(const nlohmann::json & json);

    bool valid() const;
    std::vector<std::string> errors() const;

    nlohmann::json toJSON() const;

private:
    int readInt(const nlohmann::json & parent, const char * key, int fallback, int min, std::string path);
    bool readBool(const nlohmann::json & parent, const char * key, bool fallback, std::string path);
    std::string readString(const nlohmann::json & parent, const char * key, std::string fallback, std::string path);
    TargetConfig readTarget(const nlohmann::json & parent, const char * key, std::string path);
};

#endif /* AppConfig_hpp */
