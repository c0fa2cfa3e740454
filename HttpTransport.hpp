#ifndef HTTPTRANSPORT_HPP
#define HTTPTRANSPORT_HPP

#include <cstdint>
#include <map>
#include <string>

#include <curl/curl.h>

#include "RetryPolicy.hpp"

using namespace std;

// HTTP header names compare case-insensitively
struct HeaderNameLess {
    bool operator()(const string& a, const string& b) const;
};

typedef map<string, string, HeaderNameLess> HeaderMap;

struct HttpRequest {
    string method; // "GET" or "POST"
    string url;
    HeaderMap headers;
    string body;
};

struct HttpResponse {
    long status;
    HeaderMap headers;
    string body;

    bool hasHeader(const string& name) const;
    string header(const string& name) const;
    // false when the header is absent or not a non-negative decimal
    bool headerAsUInt64(const string& name, uint64_t& value) const;
};

bool parseUInt64(const string& text, uint64_t& value);

// One synchronous request/response exchange. Any status the server sends is
// returned; only a failure to complete the exchange throws TransportError.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse perform(const HttpRequest& request) = 0;
};

class CurlTransport : public HttpTransport {
public:
    // A transfer slower than lowSpeedLimitBytes per second for
    // lowSpeedTimeSeconds is aborted with a TransportError; 0 disables the check.
    CurlTransport(long t_connectTimeoutSeconds, long t_timeoutSeconds,
                  long t_lowSpeedLimitBytes = 1, long t_lowSpeedTimeSeconds = 60);
    ~CurlTransport();

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    HttpResponse perform(const HttpRequest& request) override;

protected:
    CURL* curl; // reused so connections to the data node stay open
    long connectTimeoutSeconds;
    long timeoutSeconds;
    long lowSpeedLimitBytes;
    long lowSpeedTimeSeconds;
};

// Repeats requests whose transport failed. HTTP statuses pass straight
// through since the callers give them protocol meaning.
class RetryingTransport : public HttpTransport {
public:
    RetryingTransport(HttpTransport& t_inner, const RetryPolicy& t_policy,
                      Sleeper t_sleeper = sleepFor);

    HttpResponse perform(const HttpRequest& request) override;

protected:
    HttpTransport& inner;
    RetryPolicy policy;
    Sleeper sleeper;
};

#endif // HTTPTRANSPORT_HPP
