/** PluginRegistry [CapturePush]
 *
 * Discovers, installs, updates and loads school adapters.
 *
 * Layout of the plugins directory:
 *
 *   plugins_index.json        last successfully fetched remote index
 *   <code>/                   one directory per installed adapter
 *       adapter-<hash>.so     the module, named after its content hash
 *       version.txt
 *       descriptor.json
 *   .staging-<code>/          an install in progress
 *   .backup-<code>/           the previous install while a new one is swapped in
 *
 * Installing verifies the artifact's SHA-256 before anything is written.
 * Installs and loads of the same code are serialized; different codes
 * proceed in parallel. Modules installed on disk take precedence over
 * adapters registered with registerBuiltin().
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

#ifndef PluginRegistry_hpp
#define PluginRegistry_hpp

#include <stdio.h>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "spdlog/spdlog.h"

#include "capturepush/models/adapter_descriptor.hpp"
#include "capturepush/plugin_transport.hpp"
#include "capturepush/school_adapter.hpp"

class PluginRegistry {
    struct BuiltinAdapter {
        std::string displayName;
        SchoolAdapterFactory factory;
    };

    std::string _root;
    std::string _indexUrl;
    std::shared_ptr<PluginTransport> _transport;
    std::shared_ptr<spdlog::logger> _logger;

    std::mutex _mtx;
    std::map<std::string, std::shared_ptr<std::mutex>> _codeLocks;
    std::map<std::string, std::shared_ptr<SchoolAdapter>> _loaded;
    std::map<std::string, BuiltinAdapter> _builtins;

    std::mutex _indexMtx;

public:
    PluginRegistry(std::string root, std::string indexUrl, std::shared_ptr<PluginTransport> transport, std::shared_ptr<spdlog::logger> logger);

    // Cached index merged with the remote one when `refresh` is set. Never
    // throws for network or format problems; it falls back to the cache.
    std::vector<AdapterDescriptor> listAvailable(bool refresh = true);

    std::vector<AdapterDescriptor> listInstalled();

    // Throws NotFoundException, IntegrityException, LoadException, or
    // SyncException when the artifact cannot be downloaded.
    AdapterDescriptor install(std::string code);

    bool updateIfNewer(std::string code);

    std::shared_ptr<SchoolAdapter> resolve(std::string code);

    void registerBuiltin(std::string code, std::string displayName, SchoolAdapterFactory factory);

    // Returns false if nothing was installed for `code`.
    bool uninstall(std::string code);

    // "" when the adapter is not installed.
    std::string installedVersion(std::string code);

    std::string installPath(std::string code);

    // <0, 0, >0 like strcmp. Well formed tokens (digits plus the separators
    // "_-.:T " and space) compare numerically; a malformed token is older
    // than any well formed one; two malformed tokens compare as strings.
    static int compareVersions(const std::string & a, const std::string & b);

private:
    std::shared_ptr<std::mutex> lockFor(std::string code);
    std::map<std::string, AdapterDescriptor> readIndex(const std::string & contents, std::string source);
    AdapterDescriptor findAvailable(std::string code);
    AdapterDescriptor installDescriptor(AdapterDescriptor descriptor);
    std::shared_ptr<SchoolAdapter> loadInstalled(std::string code);
};

#endif /* PluginRegistry_hpp */
