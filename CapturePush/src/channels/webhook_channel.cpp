#include "capturepush/channels/webhook_channel.hpp"
#include "capturepush/network_request_utils.hpp"
#include "capturepush/sync_exception.hpp"

#include "nlohmann/json.hpp"

WebhookChannel::WebhookChannel(std::string url, long timeoutSeconds, std::shared_ptr<spdlog::logger> logger) :
    _url(url), _timeoutSeconds(timeoutSeconds), _logger(logger)
{
}

bool WebhookChannel::send(std::string subject, std::string content) {
    std::string body = nlohmann::json({{"subject", subject}, {"content", content}}).dump();
    try {
        PerformRequest(CreateJSONRequest(_url, "POST", body.c_str(), _timeoutSeconds));
    } catch (SyncException & ex) {
        _logger->error("Webhook {} failed: {}", _url, ex.toJSON().dump());
        return false;
    }
    return true;
}
