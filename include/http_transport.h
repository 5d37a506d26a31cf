#ifndef HTTP_TRANSPORT_H
#define HTTP_TRANSPORT_H

#include <stdint.h>
#include <string>
#include <utility>
#include <vector>

// ============================================================================
// HTTP TRANSPORT
// Plain GET with query parameters and a per-request timeout.
// Status codes follow HTTPClient: >0 is the HTTP status, <0 a transport error.
// ============================================================================

typedef std::vector<std::pair<std::string, std::string> > QueryParams;

// Transport error codes (same values as HTTPClient's HTTPC_ERROR_*)
const int HTTP_TRANSPORT_CONNECTION_REFUSED = -1;
const int HTTP_TRANSPORT_CONNECTION_LOST = -5;
const int HTTP_TRANSPORT_READ_TIMEOUT = -11;

struct HttpResponse {
    int status;
    std::string body;

    HttpResponse() : status(0) {}
    HttpResponse(int code, const std::string& text) : status(code), body(text) {}

    bool isTimeout() const { return status == HTTP_TRANSPORT_READ_TIMEOUT; }
    bool isTransportError() const { return status <= 0; }
};

class HttpTransport {
public:
    virtual ~HttpTransport() {}

    virtual HttpResponse get(const std::string& url, const QueryParams& params,
                             uint32_t timeoutMs) = 0;
};

// HTTPClient reports a connect or TLS handshake that ran out of time as a
// refused connection. A transport error that took at least `timeoutMs` is
// reported as HTTP_TRANSPORT_READ_TIMEOUT so it is retried like one.
int classifyTransportStatus(int status, uint32_t elapsedMs, uint32_t timeoutMs);

// Percent-encode a query component (RFC 3986 unreserved characters pass through)
std::string urlEncode(const std::string& value);

// url + "?" + encoded params
std::string buildQueryUrl(const std::string& url, const QueryParams& params);

#endif // HTTP_TRANSPORT_H
