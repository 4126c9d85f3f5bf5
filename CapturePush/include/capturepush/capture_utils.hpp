/** CaptureUtils [CapturePush]
 *
 * Grab bag of stateless helpers: environment, hashing and encoding via
 * OpenSSL, whitespace normalization and the handful of POSIX filesystem
 * operations the plugin cache and state store need.
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

#ifndef CaptureUtils_hpp
#define CaptureUtils_hpp

#include <stdio.h>
#include <time.h>

#include <string>
#include <vector>

class CaptureUtils {

public:
    static std::string getEnvUTF8(std::string key);

    static std::string toBase64(const unsigned char * pbegin, size_t len);
    static std::string toHex(const unsigned char * pbegin, size_t len);

    static std::string sha256Hex(const std::string & data);
    static std::string hmacSHA256(const std::string & key, const std::string & data);

    static std::string normalizeWhitespace(const std::string & str);
    static std::string toLower(std::string str);
    static std::string escapePathComponent(const std::string & str);

    static std::string localTimestampForTime(time_t time);

    // Calendar dates ("YYYY-MM-DD") as midnight UTC.
    static bool parseISODate(const std::string & str, time_t & out);
    static std::string formatISODate(time_t time);

    static bool fileExists(std::string path);
    static bool isDirectory(std::string path);
    static void makeDirectories(std::string path);
    static void removeTree(std::string path);
    static void renamePath(std::string from, std::string to);
    static std::vector<std::string> listDirectory(std::string path);

    static std::string readFile(std::string path);
    static void writeFile(std::string path, const std::string & contents);
    static void writeFileAtomically(std::string path, const std::string & contents);
};

#endif /* CaptureUtils_hpp */
