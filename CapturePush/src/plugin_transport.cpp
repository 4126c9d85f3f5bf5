#include "capturepush/plugin_transport.hpp"
#include "capturepush/network_request_utils.hpp"

CurlPluginTransport::CurlPluginTransport(long timeoutSeconds) :
    _timeoutSeconds(timeoutSeconds)
{
}

std::string CurlPluginTransport::download(std::string url) {
    return PerformRequest(CreateRequest(url, _timeoutSeconds));
}
