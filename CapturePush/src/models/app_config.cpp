#include "capturepush/models/app_config.hpp"
#include "capturepush/capture_utils.hpp"
#include "capturepush/constants.hpp"
#include "capturepush/generic_exception.hpp"

#include <set>

std::string AccountConfig::accountKey() const {
    return schoolCode + "-" + username;
}

AppConfig::AppConfig() :
    AppConfig(nlohmann::json::object())
{
}

AppConfig::AppConfig(const nlohmann::json & json) :
    jitter(DEFAULT_POLL_JITTER),
    maxRetries(DEFAULT_MAX_RETRIES),
    backoffBase(DEFAULT_BACKOFF_BASE),
    backoffMax(DEFAULT_BACKOFF_MAX),
    phaseTimeout(DEFAULT_PHASE_TIMEOUT),
    dispatchTimeout(DEFAULT_DISPATCH_TIMEOUT),
    pluginIndexUrl(DEFAULT_PLUGIN_INDEX_URL),
    autoUpdatePlugins(false),
    semesterWeeks(DEFAULT_SEMESTER_WEEKS)
{
    if (!json.is_object()) {
        _errors.push_back("config must be a JSON object");
        return;
    }

    static const nlohmann::json empty = nlohmann::json::object();
    const nlohmann::json & scheduler = json.count("scheduler") ? json["scheduler"] : empty;
    const nlohmann::json & dispatch = json.count("dispatch") ? json["dispatch"] : empty;
    const nlohmann::json & plugins = json.count("plugins") ? json["plugins"] : empty;
    const nlohmann::json & semester = json.count("semester") ? json["semester"] : empty;

    jitter = readInt(scheduler, "jitter", DEFAULT_POLL_JITTER, 0, "scheduler");
    maxRetries = readInt(scheduler, "max_retries", DEFAULT_MAX_RETRIES, 0, "scheduler");
    backoffBase = readInt(scheduler, "backoff_base", DEFAULT_BACKOFF_BASE, 0, "scheduler");
    backoffMax = readInt(scheduler, "backoff_max", DEFAULT_BACKOFF_MAX, 0, "scheduler");
    phaseTimeout = readInt(scheduler, "phase_timeout", DEFAULT_PHASE_TIMEOUT, 1, "scheduler");
    dispatchTimeout = readInt(dispatch, "timeout", DEFAULT_DISPATCH_TIMEOUT, 1, "dispatch");
    pluginIndexUrl = readString(plugins, "index_url", DEFAULT_PLUGIN_INDEX_URL, "plugins");
    autoUpdatePlugins = readBool(plugins, "auto_update", false, "plugins");
    firstMonday = readString(semester, "first_monday", "", "semester");
    semesterWeeks = readInt(semester, "weeks", DEFAULT_SEMESTER_WEEKS, 1, "semester");

    time_t parsed = 0;
    if (firstMonday != "" && !CaptureUtils::parseISODate(firstMonday, parsed)) {
        _errors.push_back("semester.first_monday must be a YYYY-MM-DD date");
    }
    if (backoffMax < backoffBase) {
        _errors.push_back("scheduler.backoff_max must be >= scheduler.backoff_base");
    }

    std::set<std::string> accountKeys;
    if (json.count("accounts")) {
        if (!json["accounts"].is_array()) {
            _errors.push_back("accounts must be an array");
        } else {
            int i = 0;
            for (const auto & item : json["accounts"]) {
                std::string path = "accounts[" + std::to_string(i++) + "]";
                if (!item.is_object()) {
                    _errors.push_back(path + " must be an object");
                    continue;
                }
                AccountConfig account;
                account.schoolCode = readString(item, "school_code", "", path);
                account.username = readString(item, "username", "", path);
                account.password = readString(item, "password", "", path);
                account.id = readString(item, "id", account.accountKey(), path);
                account.grades = readTarget(item, "grades", path);
                account.schedule = readTarget(item, "schedule", path);

                if (account.schoolCode == "") {
                    _errors.push_back(path + ".school_code is required");
                }
                if (account.username == "") {
                    _errors.push_back(path + ".username is required");
                }
                if (accountKeys.count(account.accountKey())) {
                    _errors.push_back(path + " duplicates account " + account.accountKey());
                }
                accountKeys.insert(account.accountKey());
                accounts.push_back(account);
            }
        }
    }

    std::set<std::string> channelNames;
    if (json.count("channels")) {
        if (!json["channels"].is_array()) {
            _errors.push_back("channels must be an array");
        } else {
            for (const auto & item : json["channels"]) {
                try {
                    ChannelConfig channel = ChannelConfig::FromJSON(item);
                    if (channelNames.count(channel.name)) {
                        _errors.push_back("channel " + channel.name + " is configured twice");
                    }
                    channelNames.insert(channel.name);
                    channels.push_back(channel);
                } catch (GenericException & ex) {
                    _errors.push_back(ex.what());
                }
            }
        }
    }
}

int AppConfig::readInt(const nlohmann::json & parent, const char * key, int fallback, int min, std::string path) {
    if (!parent.is_object() || !parent.count(key) || parent[key].is_null()) {
        return fallback;
    }
    if (!parent[key].is_number_integer()) {
        _errors.push_back(path + "." + key + " must be an integer");
        return fallback;
    }
    int value = parent[key].get<int>();
    if (value < min) {
        _errors.push_back(path + "." + key + " must be >= " + std::to_string(min));
        return fallback;
    }
    return value;
}

bool AppConfig::readBool(const nlohmann::json & parent, const char * key, bool fallback, std::string path) {
    if (!parent.is_object() || !parent.count(key) || parent[key].is_null()) {
        return fallback;
    }
    if (!parent[key].is_boolean()) {
        _errors.push_back(path + "." + key + " must be a boolean");
        return fallback;
    }
    return parent[key].get<bool>();
}

std::string AppConfig::readString(const nlohmann::json & parent, const char * key, std::string fallback, std::string path) {
    if (!parent.is_object() || !parent.count(key) || parent[key].is_null()) {
        return fallback;
    }
    if (parent[key].is_number()) {
        // school codes and student ids are often written as numbers
        return parent[key].dump();
    }
    if (!parent[key].is_string()) {
        _errors.push_back(path + "." + key + " must be a string");
        return fallback;
    }
    return parent[key].get<std::string>();
}

TargetConfig AppConfig::readTarget(const nlohmann::json & parent, const char * key, std::string path) {
    TargetConfig target{true, DEFAULT_POLL_INTERVAL};
    if (!parent.count(key) || parent[key].is_null()) {
        return target;
    }
    const nlohmann::json & item = parent[key];
    if (!item.is_object()) {
        _errors.push_back(path + "." + key + " must be an object");
        return target;
    }
    target.enabled = readBool(item, "enabled", true, path + "." + key);
    target.interval = readInt(item, "interval", DEFAULT_POLL_INTERVAL, 1, path + "." + key);
    return target;
}

bool AppConfig::valid() const {
    return _errors.empty();
}

std::vector<std::string> AppConfig::errors() const {
    return _errors;
}

nlohmann::json AppConfig::toJSON() const {
    nlohmann::json accountsJSON = nlohmann::json::array();
    for (const auto & a : accounts) {
        accountsJSON.push_back({
            {"id", a.id},
            {"school_code", a.schoolCode},
            {"username", a.username},
            {"grades", {{"enabled", a.grades.enabled}, {"interval", a.grades.interval}}},
            {"schedule", {{"enabled", a.schedule.enabled}, {"interval", a.schedule.interval}}},
        });
    }
    nlohmann::json channelsJSON = nlohmann::json::array();
    for (const auto & c : channels) {
        channelsJSON.push_back(c.toJSON());
    }
    return {
        {"accounts", accountsJSON},
        {"channels", channelsJSON},
        {"scheduler", {
            {"jitter", jitter},
            {"max_retries", maxRetries},
            {"backoff_base", backoffBase},
            {"backoff_max", backoffMax},
            {"phase_timeout", phaseTimeout},
        }},
        {"dispatch", {{"timeout", dispatchTimeout}}},
        {"plugins", {{"index_url", pluginIndexUrl}, {"auto_update", autoUpdatePlugins}}},
        {"semester", {{"first_monday", firstMonday}, {"weeks", semesterWeeks}}},
    };
}
