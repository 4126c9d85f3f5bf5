#include "capturepush/models/adapter_descriptor.hpp"
#include "capturepush/capture_utils.hpp"
#include "capturepush/generic_exception.hpp"

static std::string firstString(const nlohmann::json & entry, const char * key, const char * legacyKey) {
    for (const char * k : {key, legacyKey}) {
        if (entry.count(k) && entry[k].is_string()) {
            return entry[k].get<std::string>();
        }
        if (entry.count(k) && entry[k].is_number()) {
            return entry[k].dump();
        }
    }
    return "";
}

AdapterDescriptor::AdapterDescriptor() {
}

AdapterDescriptor::AdapterDescriptor(std::string code, std::string displayName, std::string version, std::string downloadUrl, std::string contentHash) :
    code(code), displayName(displayName), version(version), downloadUrl(downloadUrl), contentHash(contentHash)
{
}

AdapterDescriptor AdapterDescriptor::FromIndexEntry(std::string code, const nlohmann::json & entry) {
    if (!entry.is_object()) {
        throw GenericException("Plugin index entry for " + code + " is not an object");
    }
    AdapterDescriptor d;
    d.code = code;
    d.displayName = firstString(entry, "display_name", "school_name");
    d.version = firstString(entry, "version", "plugin_version");
    d.downloadUrl = firstString(entry, "download_url", "url");
    d.contentHash = CaptureUtils::toLower(firstString(entry, "sha256", "content_hash"));
    return d;
}

AdapterDescriptor AdapterDescriptor::FromJSON(const nlohmann::json & json) {
    AdapterDescriptor d = FromIndexEntry(json.value("code", ""), json);
    d.localPath = json.value("local_path", "");
    return d;
}

nlohmann::json AdapterDescriptor::toJSON() const {
    return {
        {"code", code},
        {"display_name", displayName},
        {"version", version},
        {"download_url", downloadUrl},
        {"sha256", contentHash},
        {"local_path", localPath},
    };
}
