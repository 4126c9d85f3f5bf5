#include "capturepush/channels/feishu_channel.hpp"
#include "capturepush/capture_utils.hpp"
#include "capturepush/network_request_utils.hpp"
#include "capturepush/sync_exception.hpp"

FeishuChannel::FeishuChannel(std::string webhookUrl, std::string secret, long timeoutSeconds, std::shared_ptr<spdlog::logger> logger) :
    _webhookUrl(webhookUrl), _secret(secret), _timeoutSeconds(timeoutSeconds), _logger(logger)
{
}

std::string FeishuChannel::signature(std::string timestamp, std::string secret) {
    std::string digest = CaptureUtils::hmacSHA256(timestamp + "\n" + secret, "");
    return CaptureUtils::toBase64((const unsigned char *)digest.data(), digest.size());
}

nlohmann::json FeishuChannel::payload(std::string subject, std::string content, time_t timestamp) {
    nlohmann::json body = {
        {"msg_type", "text"},
        {"content", {{"text", subject + "\n\n" + content}}},
    };
    if (_secret != "") {
        std::string ts = std::to_string((long long)timestamp);
        body["timestamp"] = ts;
        body["sign"] = signature(ts, _secret);
    }
    return body;
}

bool FeishuChannel::send(std::string subject, std::string content) {
    std::string body = payload(subject, content, time(0)).dump();
    _logger->info("Sending Feishu message: {}", subject);

    try {
        nlohmann::json result = PerformJSONRequest(CreateJSONRequest(_webhookUrl, "POST", body.c_str(), _timeoutSeconds));
        // older bot endpoints answer with StatusCode instead of code
        int code = result.count("code") ? result["code"].get<int>() : result.value("StatusCode", -1);
        if (code != 0) {
            _logger->error("Feishu rejected the message: {}", result.dump());
            return false;
        }
    } catch (SyncException & ex) {
        _logger->error("Feishu request failed: {}", ex.toJSON().dump());
        return false;
    } catch (nlohmann::json::exception & ex) {
        _logger->error("Feishu returned an unexpected response: {}", ex.what());
        return false;
    }
    return true;
}
