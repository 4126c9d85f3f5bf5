#include "capturepush/channels/server_chan_channel.hpp"
#include "capturepush/network_request_utils.hpp"
#include "capturepush/sync_exception.hpp"

ServerChanChannel::ServerChanChannel(std::string sendKey, long timeoutSeconds, std::shared_ptr<spdlog::logger> logger, std::string baseUrl) :
    _sendKey(sendKey), _baseUrl(baseUrl), _timeoutSeconds(timeoutSeconds), _logger(logger)
{
}

std::string ServerChanChannel::endpoint() {
    return _baseUrl + _sendKey + ".send";
}

std::string ServerChanChannel::formBody(std::string subject, std::string content) {
    // ServerChan renders desp as markdown; double newlines keep line breaks
    std::string desp;
    for (char c : content) {
        if (c == '\n') {
            desp += "\n\n";
        } else {
            desp.push_back(c);
        }
    }
    return "title=" + EscapeFormValue(subject) + "&desp=" + EscapeFormValue(desp);
}

bool ServerChanChannel::send(std::string subject, std::string content) {
    std::string form = formBody(subject, content);
    _logger->info("Sending ServerChan message: {}", subject);

    try {
        nlohmann::json result = PerformJSONRequest(CreateFormRequest(endpoint(), form.c_str(), _timeoutSeconds));
        if (result.value("code", -1) != 0) {
            _logger->error("ServerChan rejected the message: {}", result.dump());
            return false;
        }
    } catch (SyncException & ex) {
        _logger->error("ServerChan request failed: {}", ex.toJSON().dump());
        return false;
    } catch (nlohmann::json::exception & ex) {
        _logger->error("ServerChan returned an unexpected response: {}", ex.what());
        return false;
    }
    return true;
}
