/** DynamicSchoolAdapter [CapturePush]
 *
 * A SchoolAdapter backed by a module loaded at runtime. AdapterModule owns
 * the dlopen handle; adapters share it, so a module stays mapped for as
 * long as any adapter created from it is alive, even after the registry
 * has replaced or uninstalled it.
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

#ifndef DynamicSchoolAdapter_hpp
#define DynamicSchoolAdapter_hpp

#include <stdio.h>
#include <memory>
#include <string>

#include "spdlog/spdlog.h"

#include "capturepush/adapter_abi.h"
#include "capturepush/school_adapter.hpp"

typedef int (*capturepush_abi_version_t)(void);
typedef const char* (*capturepush_school_name_t)(void);
typedef int (*capturepush_fetch_t)(const char*, const char*, int, char**);
typedef void (*capturepush_free_t)(char*);

class AdapterModule {
    void * _handle;

public:
    std::string code;
    std::string path;

    capturepush_abi_version_t abiVersion;
    capturepush_school_name_t schoolName;
    capturepush_fetch_t fetchGrades;
    capturepush_fetch_t fetchCourseSchedule;
    capturepush_free_t release;

    // Throws LoadException if the file cannot be loaded, a required symbol
    // is missing, or the module was built for another ABI version.
    AdapterModule(std::string code, std::string path);
    ~AdapterModule();

private:
    AdapterModule(const AdapterModule&);
    AdapterModule& operator=(const AdapterModule&);
};

class DynamicSchoolAdapter : public SchoolAdapter {
    std::shared_ptr<AdapterModule> _module;
    std::shared_ptr<spdlog::logger> _logger;

public:
    DynamicSchoolAdapter(std::shared_ptr<AdapterModule> module, std::shared_ptr<spdlog::logger> logger);

    std::string schoolCode();
    std::string schoolName();
    std::string modulePath();

    RecordList fetchGrades(const Credentials & credentials, bool forceUpdate);
    RecordList fetchCourseSchedule(const Credentials & credentials, bool forceUpdate);

private:
    RecordList callFetch(capturepush_fetch_t fn, const char * name, const Credentials & credentials, bool forceUpdate);
};

#endif /* DynamicSchoolAdapter_hpp */
