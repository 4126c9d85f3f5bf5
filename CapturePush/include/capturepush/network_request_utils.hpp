/** NetworkRequestUtils [CapturePush]
 *
 * Thin libcurl helpers shared by the plugin index / artifact downloads and
 * the webhook notification channels. Failures are thrown as SyncException.
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

#ifndef NetworkRequestUtils_hpp
#define NetworkRequestUtils_hpp

#include <curl/curl.h>
#include <stdio.h>
#include <string>
#include "nlohmann/json.hpp"


size_t _onAppendToString(void *contents, size_t length, size_t nmemb, void *userp);

CURL * CreateRequest(std::string url, long timeoutSeconds = 30);
CURL * CreateJSONRequest(std::string url, std::string method = "GET", const char * payloadChars = nullptr, long timeoutSeconds = 30);
CURL * CreateFormRequest(std::string url, const char * formChars, long timeoutSeconds = 30);

const std::string PerformRequest(CURL * curl_handle);
const nlohmann::json PerformJSONRequest(CURL * curl_handle);

void ValidateRequestResp(CURLcode res, CURL * curl_handle, std::string resp);

std::string EscapeFormValue(std::string value);

#endif /* NetworkRequestUtils_hpp */
