#include "capturepush/dynamic_school_adapter.hpp"
#include "capturepush/plugin_exception.hpp"
#include "capturepush/sync_exception.hpp"

#include <dlfcn.h>

#pragma mark AdapterModule

AdapterModule::AdapterModule(std::string code, std::string path) :
    _handle(nullptr), code(code), path(path)
{
    // Clear any previous error
    dlerror();

    _handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (_handle == nullptr) {
        const char * err = dlerror();
        throw LoadException(code, std::string("dlopen failed: ") + (err ? err : path));
    }

    abiVersion = (capturepush_abi_version_t)dlsym(_handle, "capturepush_abi_version");
    schoolName = (capturepush_school_name_t)dlsym(_handle, "capturepush_school_name");
    fetchGrades = (capturepush_fetch_t)dlsym(_handle, "capturepush_fetch_grades");
    fetchCourseSchedule = (capturepush_fetch_t)dlsym(_handle, "capturepush_fetch_course_schedule");
    release = (capturepush_free_t)dlsym(_handle, "capturepush_free");

    // Verify all functions were loaded
    if (!abiVersion || !schoolName || !fetchGrades || !fetchCourseSchedule || !release) {
        dlclose(_handle);
        _handle = nullptr;
        throw LoadException(code, path + " does not export the adapter interface");
    }

    int version = abiVersion();
    if (version != CAPTUREPUSH_ADAPTER_ABI_VERSION) {
        dlclose(_handle);
        _handle = nullptr;
        throw LoadException(code, path + " was built for adapter ABI " + std::to_string(version) + ", expected " + std::to_string(CAPTUREPUSH_ADAPTER_ABI_VERSION));
    }
}

AdapterModule::~AdapterModule() {
    if (_handle != nullptr) {
        dlclose(_handle);
    }
}

#pragma mark DynamicSchoolAdapter

DynamicSchoolAdapter::DynamicSchoolAdapter(std::shared_ptr<AdapterModule> module, std::shared_ptr<spdlog::logger> logger) :
    _module(module), _logger(logger)
{
}

std::string DynamicSchoolAdapter::schoolCode() {
    return _module->code;
}

std::string DynamicSchoolAdapter::schoolName() {
    const char * name = _module->schoolName();
    return name ? std::string(name) : _module->code;
}

std::string DynamicSchoolAdapter::modulePath() {
    return _module->path;
}

RecordList DynamicSchoolAdapter::fetchGrades(const Credentials & credentials, bool forceUpdate) {
    return callFetch(_module->fetchGrades, "fetch_grades", credentials, forceUpdate);
}

RecordList DynamicSchoolAdapter::fetchCourseSchedule(const Credentials & credentials, bool forceUpdate) {
    return callFetch(_module->fetchCourseSchedule, "fetch_course_schedule", credentials, forceUpdate);
}

RecordList DynamicSchoolAdapter::callFetch(capturepush_fetch_t fn, const char * name, const Credentials & credentials, bool forceUpdate) {
    char * out = nullptr;
    int rc = fn(credentials.username.c_str(), credentials.password.c_str(), forceUpdate ? 1 : 0, &out);

    std::string output = out ? std::string(out) : "";
    if (out) {
        _module->release(out);
    }

    if (rc != CAPTUREPUSH_OK) {
        throw SyncException(std::string(name) + "-failed", _module->code + ": " + output, rc == CAPTUREPUSH_ERROR_RETRYABLE);
    }

    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(output);
    } catch (nlohmann::json::exception & ex) {
        _logger->error("{} {} returned invalid JSON: {}", _module->code, name, ex.what());
        return nullptr;
    }
    if (!parsed.is_array()) {
        _logger->error("{} {} returned {} instead of an array", _module->code, name, parsed.type_name());
        return nullptr;
    }

    auto records = std::make_shared<std::vector<nlohmann::json>>();
    for (const auto & item : parsed) {
        records->push_back(item);
    }
    return records;
}
