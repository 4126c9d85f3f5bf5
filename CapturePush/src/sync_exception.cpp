#include "capturepush/sync_exception.hpp"

SyncException::SyncException(std::string key, std::string di, bool retryable) :
    GenericException(key + ": " + di), retryable(retryable), key(key), debuginfo(di)
{

}

SyncException::SyncException(CURLcode c, std::string di) :
    GenericException(std::string(curl_easy_strerror(c)) + ": " + di), key(curl_easy_strerror(c)), debuginfo(di)
{
    if ((c == CURLE_COULDNT_RESOLVE_PROXY) ||
        (c == CURLE_COULDNT_RESOLVE_HOST) ||
        (c == CURLE_COULDNT_CONNECT) ||
        (c == CURLE_HTTP_RETURNED_ERROR) ||
        (c == CURLE_OPERATION_TIMEDOUT) ||
        (c == CURLE_PARTIAL_FILE) ||
        (c == CURLE_HTTP_POST_ERROR) ||
        (c == CURLE_SSL_CONNECT_ERROR) ||
        (c == CURLE_TOO_MANY_REDIRECTS) ||
        (c == CURLE_PEER_FAILED_VERIFICATION) ||
        (c == CURLE_GOT_NOTHING) ||
        (c == CURLE_SEND_ERROR) ||
        (c == CURLE_RECV_ERROR) ||
        (c == CURLE_AGAIN)) {
        retryable = true;
        offline = true;
    }
}

bool SyncException::isRetryable() {
    return retryable;
}

bool SyncException::isOffline() {
    return offline;
}

nlohmann::json SyncException::toJSON() {
    return {
        {"what", what()},
        {"key", key},
        {"debuginfo", debuginfo},
        {"retryable", retryable},
    };
}
