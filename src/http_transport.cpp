#include "http_transport.h"

#include <cstdio>

int classifyTransportStatus(int status, uint32_t elapsedMs, uint32_t timeoutMs) {
    if (status < 0 && timeoutMs > 0 && elapsedMs >= timeoutMs) {
        return HTTP_TRANSPORT_READ_TIMEOUT;
    }
    return status;
}

std::string urlEncode(const std::string& value) {
    std::string out;
    out.reserve(value.size() * 3);
    for (size_t i = 0; i < value.size(); i++) {
        unsigned char c = (unsigned char)value[i];
        bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                          (c >= '0' && c <= '9') || c == '-' || c == '_' ||
                          c == '.' || c == '~';
        if (unreserved) {
            out += (char)c;
        } else {
            char hex[4];
            snprintf(hex, sizeof(hex), "%%%02X", c);
            out += hex;
        }
    }
    return out;
}

std::string buildQueryUrl(const std::string& url, const QueryParams& params) {
    std::string full = url;
    char separator = (url.find('?') == std::string::npos) ? '?' : '&';
    for (size_t i = 0; i < params.size(); i++) {
        full += separator;
        full += urlEncode(params[i].first);
        full += '=';
        full += urlEncode(params[i].second);
        separator = '&';
    }
    return full;
}
