/** Constants [CapturePush]
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

#ifndef constants_hpp
#define constants_hpp

#include <string>
#include <vector>

#define FS_PATH_SEP "/"

#define PLUGIN_INDEX_FILENAME       "plugins_index.json"
#define PLUGIN_VERSION_FILENAME     "version.txt"
#define PLUGIN_DESCRIPTOR_FILENAME  "descriptor.json"
#define PLUGIN_STAGING_PREFIX       ".staging-"
#define PLUGIN_BACKUP_PREFIX        ".backup-"

#define DEFAULT_PLUGIN_INDEX_URL    "https://github.com/pjnt9372/Capture_Push_Plugin/releases/latest/download/plugins_index.json"

// Polling defaults, all in seconds. Each can be overridden in the config.
#define DEFAULT_POLL_INTERVAL       3600
#define DEFAULT_POLL_JITTER         30
#define DEFAULT_MAX_RETRIES         3
#define DEFAULT_BACKOFF_BASE        3
#define DEFAULT_BACKOFF_MAX         300
#define DEFAULT_PHASE_TIMEOUT       120
#define DEFAULT_DISPATCH_TIMEOUT    10
#define DEFAULT_SEMESTER_WEEKS      20

static std::vector<std::string> STATE_SETUP_QUERIES = {
    "CREATE TABLE IF NOT EXISTS Snapshot ("
        "kind VARCHAR(16) PRIMARY KEY,"
        "accountKey TEXT,"
        "capturedAt INTEGER,"
        "recordCount INTEGER,"
        "data TEXT)",
};

#endif /* constants_hpp */
