#include "capturepush/plugin_registry.hpp"
#include "capturepush/capture_utils.hpp"
#include "capturepush/constants.hpp"
#include "capturepush/dynamic_school_adapter.hpp"
#include "capturepush/plugin_exception.hpp"
#include "capturepush/sync_exception.hpp"

#include <stdint.h>

static bool parseVersionToken(const std::string & token, uint64_t & out) {
    std::string digits;
    for (char c : token) {
        if (c >= '0' && c <= '9') {
            digits.push_back(c);
        } else if (c == '_' || c == '-' || c == '.' || c == ':' || c == 'T' || c == ' ') {
            continue;
        } else {
            return false;
        }
    }
    // 19 digits always fit in a uint64_t
    if (digits.size() == 0 || digits.size() > 19) {
        return false;
    }
    out = 0;
    for (char c : digits) {
        out = out * 10 + (uint64_t)(c - '0');
    }
    return true;
}

static bool endsWith(const std::string & str, const std::string & suffix) {
    return str.size() >= suffix.size() && str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

PluginRegistry::PluginRegistry(std::string root, std::string indexUrl, std::shared_ptr<PluginTransport> transport, std::shared_ptr<spdlog::logger> logger) :
    _root(root), _indexUrl(indexUrl), _transport(transport), _logger(logger)
{
    CaptureUtils::makeDirectories(_root);
}

int PluginRegistry::compareVersions(const std::string & a, const std::string & b) {
    uint64_t va = 0, vb = 0;
    bool okA = parseVersionToken(a, va);
    bool okB = parseVersionToken(b, vb);

    if (okA && okB) {
        return va < vb ? -1 : (va > vb ? 1 : 0);
    }
    if (okA != okB) {
        return okA ? 1 : -1;
    }
    int c = a.compare(b);
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

std::shared_ptr<std::mutex> PluginRegistry::lockFor(std::string code) {
    std::lock_guard<std::mutex> lock(_mtx);
    auto it = _codeLocks.find(code);
    if (it != _codeLocks.end()) {
        return it->second;
    }
    auto mtx = std::make_shared<std::mutex>();
    _codeLocks[code] = mtx;
    return mtx;
}

std::string PluginRegistry::installPath(std::string code) {
    return _root + FS_PATH_SEP + CaptureUtils::escapePathComponent(code);
}

std::string PluginRegistry::installedVersion(std::string code) {
    std::string path = installPath(code) + FS_PATH_SEP + PLUGIN_VERSION_FILENAME;
    if (!CaptureUtils::fileExists(path)) {
        return "";
    }
    return CaptureUtils::normalizeWhitespace(CaptureUtils::readFile(path));
}

#pragma mark Index

std::map<std::string, AdapterDescriptor> PluginRegistry::readIndex(const std::string & contents, std::string source) {
    nlohmann::json json = nlohmann::json::parse(contents);
    if (!json.is_object()) {
        throw GenericException("plugin index from " + source + " is not a JSON object");
    }
    std::map<std::string, AdapterDescriptor> results;
    for (auto it = json.begin(); it != json.end(); ++it) {
        try {
            results[it.key()] = AdapterDescriptor::FromIndexEntry(it.key(), it.value());
        } catch (GenericException & ex) {
            _logger->warn("Skipping plugin index entry from {}: {}", source, ex.what());
        }
    }
    return results;
}

std::vector<AdapterDescriptor> PluginRegistry::listAvailable(bool refresh) {
    std::lock_guard<std::mutex> lock(_indexMtx);
    std::string cachePath = _root + FS_PATH_SEP + PLUGIN_INDEX_FILENAME;
    std::map<std::string, AdapterDescriptor> merged;

    if (CaptureUtils::fileExists(cachePath)) {
        try {
            merged = readIndex(CaptureUtils::readFile(cachePath), cachePath);
        } catch (GenericException & ex) {
            _logger->warn("Ignoring unreadable plugin index cache: {}", ex.what());
        } catch (nlohmann::json::exception & ex) {
            _logger->warn("Ignoring malformed plugin index cache: {}", ex.what());
        }
    }

    if (refresh && _indexUrl != "") {
        try {
            std::string body = _transport->download(_indexUrl);
            std::map<std::string, AdapterDescriptor> remote = readIndex(body, _indexUrl);
            CaptureUtils::writeFileAtomically(cachePath, body);
            for (const auto & pair : remote) {
                merged[pair.first] = pair.second;
            }
        } catch (SyncException & ex) {
            _logger->warn("Plugin index is unreachable, using the cached copy: {}", ex.toJSON().dump());
        } catch (GenericException & ex) {
            _logger->warn("Plugin index could not be refreshed, using the cached copy: {}", ex.what());
        } catch (nlohmann::json::exception & ex) {
            _logger->warn("Plugin index is malformed, using the cached copy: {}", ex.what());
        }
    }

    std::vector<AdapterDescriptor> results;
    for (auto & pair : merged) {
        if (CaptureUtils::isDirectory(installPath(pair.first))) {
            pair.second.localPath = installPath(pair.first);
        }
        results.push_back(pair.second);
    }
    return results;
}

std::vector<AdapterDescriptor> PluginRegistry::listInstalled() {
    std::vector<AdapterDescriptor> results;
    for (const auto & name : CaptureUtils::listDirectory(_root)) {
        std::string dir = _root + FS_PATH_SEP + name;
        if (name.size() == 0 || name[0] == '.' || !CaptureUtils::isDirectory(dir)) {
            continue;
        }
        try {
            AdapterDescriptor d = AdapterDescriptor::FromJSON(nlohmann::json::parse(CaptureUtils::readFile(dir + FS_PATH_SEP + PLUGIN_DESCRIPTOR_FILENAME)));
            d.version = installedVersion(d.code);
            d.localPath = dir;
            results.push_back(d);
        } catch (GenericException & ex) {
            _logger->warn("Skipping plugin directory {}: {}", dir, ex.what());
        } catch (nlohmann::json::exception & ex) {
            _logger->warn("Skipping plugin directory {}: {}", dir, ex.what());
        }
    }
    return results;
}

AdapterDescriptor PluginRegistry::findAvailable(std::string code) {
    for (const auto & d : listAvailable(true)) {
        if (d.code == code) {
            return d;
        }
    }
    throw NotFoundException(code, "not listed in the plugin index");
}

#pragma mark Install

static void removeTreeLogged(std::string path, std::shared_ptr<spdlog::logger> logger) {
    try {
        CaptureUtils::removeTree(path);
    } catch (GenericException & ex) {
        logger->warn("Unable to clean up {}: {}", path, ex.what());
    }
}

AdapterDescriptor PluginRegistry::install(std::string code) {
    return installDescriptor(findAvailable(code));
}

bool PluginRegistry::updateIfNewer(std::string code) {
    AdapterDescriptor remote = findAvailable(code);
    std::string local = installedVersion(code);

    if (compareVersions(remote.version, local) <= 0) {
        _logger->info("Adapter {} is up to date (installed \"{}\", available \"{}\")", code, local, remote.version);
        return false;
    }
    _logger->info("Updating adapter {} from \"{}\" to \"{}\"", code, local, remote.version);
    installDescriptor(remote);
    return true;
}

AdapterDescriptor PluginRegistry::installDescriptor(AdapterDescriptor descriptor) {
    std::string code = descriptor.code;
    auto codeLock = lockFor(code);
    std::lock_guard<std::mutex> guard(*codeLock);

    if (descriptor.downloadUrl == "") {
        throw NotFoundException(code, "plugin index entry has no download_url");
    }

    _logger->info("Installing adapter {} version {} from {}", code, descriptor.version, descriptor.downloadUrl);
    std::string artifact = _transport->download(descriptor.downloadUrl);
    std::string actual = CaptureUtils::sha256Hex(artifact);
    if (descriptor.contentHash == "" || CaptureUtils::toLower(descriptor.contentHash) != actual) {
        throw IntegrityException(code, descriptor.contentHash == "" ? "(none)" : descriptor.contentHash, actual);
    }

    std::string escaped = CaptureUtils::escapePathComponent(code);
    std::string finalDir = installPath(code);
    std::string staging = _root + FS_PATH_SEP + PLUGIN_STAGING_PREFIX + escaped;
    std::string backup = _root + FS_PATH_SEP + PLUGIN_BACKUP_PREFIX + escaped;

    // dlopen reuses an already loaded object with the same path, so the
    // module file is named after its content
    std::string moduleName = "adapter-" + actual.substr(0, 16) + ".so";

    AdapterDescriptor installed = descriptor;
    installed.contentHash = actual;
    installed.localPath = finalDir;

    try {
        CaptureUtils::removeTree(staging);
        CaptureUtils::makeDirectories(staging);
        CaptureUtils::writeFile(staging + FS_PATH_SEP + moduleName, artifact);
        CaptureUtils::writeFile(staging + FS_PATH_SEP + PLUGIN_VERSION_FILENAME, descriptor.version);
        CaptureUtils::writeFile(staging + FS_PATH_SEP + PLUGIN_DESCRIPTOR_FILENAME, installed.toJSON().dump(2));
    } catch (GenericException & ex) {
        removeTreeLogged(staging, _logger);
        throw;
    }

    bool hadPrevious = CaptureUtils::isDirectory(finalDir);
    CaptureUtils::removeTree(backup);
    if (hadPrevious) {
        CaptureUtils::renamePath(finalDir, backup);
    }
    try {
        CaptureUtils::renamePath(staging, finalDir);
    } catch (GenericException & ex) {
        if (hadPrevious) {
            CaptureUtils::renamePath(backup, finalDir);
        }
        removeTreeLogged(staging, _logger);
        throw;
    }

    std::shared_ptr<SchoolAdapter> adapter;
    try {
        adapter = std::make_shared<DynamicSchoolAdapter>(std::make_shared<AdapterModule>(code, finalDir + FS_PATH_SEP + moduleName), _logger);
    } catch (LoadException & ex) {
        _logger->error("Adapter {} failed to load, restoring the previous install: {}", code, ex.what());
        removeTreeLogged(finalDir, _logger);
        if (hadPrevious) {
            CaptureUtils::renamePath(backup, finalDir);
        }
        throw;
    }
    removeTreeLogged(backup, _logger);

    {
        std::lock_guard<std::mutex> lock(_mtx);
        _loaded[code] = adapter;
    }
    _logger->info("Installed adapter {} ({}) version {}", code, adapter->schoolName(), descriptor.version);
    return installed;
}

bool PluginRegistry::uninstall(std::string code) {
    auto codeLock = lockFor(code);
    std::lock_guard<std::mutex> guard(*codeLock);

    std::string dir = installPath(code);
    if (!CaptureUtils::isDirectory(dir)) {
        return false;
    }
    CaptureUtils::removeTree(dir);
    {
        // adapters already handed out keep the module mapped until released
        std::lock_guard<std::mutex> lock(_mtx);
        _loaded.erase(code);
    }
    _logger->info("Uninstalled adapter {}", code);
    return true;
}

#pragma mark Resolve

void PluginRegistry::registerBuiltin(std::string code, std::string displayName, SchoolAdapterFactory factory) {
    std::lock_guard<std::mutex> lock(_mtx);
    _builtins[code] = BuiltinAdapter{displayName, factory};
}

std::shared_ptr<SchoolAdapter> PluginRegistry::loadInstalled(std::string code) {
    std::string dir = installPath(code);
    for (const auto & name : CaptureUtils::listDirectory(dir)) {
        if (endsWith(name, ".so")) {
            auto module = std::make_shared<AdapterModule>(code, dir + FS_PATH_SEP + name);
            return std::make_shared<DynamicSchoolAdapter>(module, _logger);
        }
    }
    throw LoadException(code, dir + " does not contain an adapter module");
}

std::shared_ptr<SchoolAdapter> PluginRegistry::resolve(std::string code) {
    auto codeLock = lockFor(code);
    std::lock_guard<std::mutex> guard(*codeLock);

    SchoolAdapterFactory factory;
    {
        std::lock_guard<std::mutex> lock(_mtx);
        auto loaded = _loaded.find(code);
        if (loaded != _loaded.end()) {
            return loaded->second;
        }
        auto builtin = _builtins.find(code);
        if (builtin != _builtins.end()) {
            factory = builtin->second.factory;
        }
    }

    std::shared_ptr<SchoolAdapter> adapter;
    if (CaptureUtils::isDirectory(installPath(code))) {
        adapter = loadInstalled(code);
    } else if (factory) {
        adapter = factory();
        if (adapter == nullptr) {
            throw LoadException(code, "built-in adapter factory returned null");
        }
    } else {
        throw NotFoundException(code, "no adapter is installed or built in for this institution");
    }

    std::lock_guard<std::mutex> lock(_mtx);
    _loaded[code] = adapter;
    return adapter;
}
