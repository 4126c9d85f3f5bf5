#include "capturepush/models/channel_config.hpp"
#include "capturepush/generic_exception.hpp"

ChannelConfig::ChannelConfig() :
    enabled(false)
{
}

ChannelConfig::ChannelConfig(std::string name, bool enabled, std::map<std::string, std::string> parameters) :
    name(name), enabled(enabled), parameters(parameters)
{
}

ChannelConfig ChannelConfig::FromJSON(const nlohmann::json & json) {
    if (!json.is_object() || !json.count("name") || !json["name"].is_string() || json["name"].get<std::string>() == "") {
        throw GenericException("Channel entry needs a name: " + json.dump());
    }
    ChannelConfig config;
    config.name = json["name"].get<std::string>();
    config.enabled = json.value("enabled", true);

    if (json.count("parameters") && json["parameters"].is_object()) {
        for (auto it = json["parameters"].begin(); it != json["parameters"].end(); ++it) {
            if (it.value().is_string()) {
                config.parameters[it.key()] = it.value().get<std::string>();
            } else if (!it.value().is_null()) {
                config.parameters[it.key()] = it.value().dump();
            }
        }
    }
    return config;
}

std::string ChannelConfig::type() const {
    std::string t = parameter("type");
    return t != "" ? t : name;
}

std::string ChannelConfig::parameter(const std::string & key, std::string fallback) const {
    auto it = parameters.find(key);
    if (it == parameters.end()) {
        return fallback;
    }
    return it->second;
}

bool ChannelConfig::hasParameter(const std::string & key) const {
    auto it = parameters.find(key);
    return it != parameters.end() && it->second != "";
}

nlohmann::json ChannelConfig::toJSON() const {
    return {
        {"name", name},
        {"enabled", enabled},
        {"parameters", parameters},
    };
}
