/** SPDLogExtensions [CapturePush]
 *
 * Logger construction shared by the CLI and the tests. When attached to a
 * parent process everything goes to a rotating log file in the config
 * directory; in console mode it goes to colored stdout. Critical messages
 * always go to stderr as well so the parent can report them.
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

#ifndef SPDLogExtensions_hpp
#define SPDLogExtensions_hpp

#include <memory>
#include <string>

#include "spdlog/spdlog.h"
#include "spdlog/pattern_formatter.h"

// `%N` in a pattern prints the name given to the thread via SetThreadName.
class ThreadNameFormatterFlag : public spdlog::custom_flag_formatter {
public:
    void format(const spdlog::details::log_msg & msg, const std::tm & tm_time, spdlog::memory_buf_t & dest) override;
    std::unique_ptr<spdlog::custom_flag_formatter> clone() const override;
};

std::shared_ptr<spdlog::logger> CreateCaptureLogger(std::string name, std::string logPath, bool console, bool verbose);

std::shared_ptr<spdlog::logger> CreateNullLogger(std::string name);

#endif /* SPDLogExtensions_hpp */
