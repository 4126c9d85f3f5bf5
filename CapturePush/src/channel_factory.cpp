#include "capturepush/channel_factory.hpp"
#include "capturepush/channels/feishu_channel.hpp"
#include "capturepush/channels/server_chan_channel.hpp"
#include "capturepush/channels/webhook_channel.hpp"
#include "capturepush/plugin_exception.hpp"

#include <errno.h>
#include <stdlib.h>

ChannelFactory::ChannelFactory(std::shared_ptr<spdlog::logger> logger, long timeoutSeconds) :
    _logger(logger), _timeoutSeconds(timeoutSeconds)
{
    registerType("feishu", [this](const ChannelConfig & config) {
        return std::make_shared<FeishuChannel>(requireParameter(config, "webhook_url"), config.parameter("secret"), _timeoutSeconds, _logger);
    });
    registerType("serverchan", [this](const ChannelConfig & config) {
        return std::make_shared<ServerChanChannel>(requireParameter(config, "send_key"), _timeoutSeconds, _logger);
    });
    registerType("webhook", [this](const ChannelConfig & config) {
        return std::make_shared<WebhookChannel>(requireParameter(config, "url"), _timeoutSeconds, _logger);
    });
}

void ChannelFactory::registerType(std::string type, ChannelConstructor constructor) {
    _constructors[type] = constructor;
}

std::vector<std::string> ChannelFactory::types() {
    std::vector<std::string> result;
    for (const auto & pair : _constructors) {
        result.push_back(pair.first);
    }
    return result;
}

std::shared_ptr<NotificationChannel> ChannelFactory::create(const ChannelConfig & config) {
    auto it = _constructors.find(config.type());
    if (it == _constructors.end()) {
        throw LoadException(config.name, "unknown channel type \"" + config.type() + "\"");
    }
    return it->second(config);
}

std::string ChannelFactory::requireParameter(const ChannelConfig & config, std::string key) {
    if (!config.hasParameter(key)) {
        throw LoadException(config.name, "missing required parameter \"" + key + "\"");
    }
    return config.parameter(key);
}

long ChannelFactory::integerParameter(const ChannelConfig & config, std::string key, long defaultValue, long min, long max) {
    if (!config.hasParameter(key)) {
        return defaultValue;
    }
    std::string value = config.parameter(key);
    char * end = nullptr;
    errno = 0;
    long parsed = strtol(value.c_str(), &end, 10);
    if (value == "" || end == nullptr || *end != '\0' || errno == ERANGE || parsed < min || parsed > max) {
        throw LoadException(config.name, "parameter \"" + key + "\" must be an integer between " + std::to_string(min) + " and " + std::to_string(max) + ", got \"" + value + "\"");
    }
    return parsed;
}
