#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <memory>
#include <strings.h>

#include "logger.hpp"
#include "HttpTransport.hpp"
#include "UploadErrors.hpp"

bool HeaderNameLess::operator()(const string& a, const string& b) const
{
    return strcasecmp(a.c_str(), b.c_str()) < 0;
}

bool HttpResponse::hasHeader(const string& name) const
{
    return headers.count(name) > 0;
}

string HttpResponse::header(const string& name) const
{
    auto it = headers.find(name);
    if (it == headers.end()) {
        return "";
    }
    return it->second;
}

bool HttpResponse::headerAsUInt64(const string& name, uint64_t& value) const
{
    auto it = headers.find(name);
    if (it == headers.end()) {
        return false;
    }
    return parseUInt64(it->second, value);
}

bool parseUInt64(const string& text, uint64_t& value)
{
    if (text.empty()) {
        return false;
    }
    for (char c : text) {
        if (!isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    errno = 0;
    char* end = nullptr;
    unsigned long long parsed = strtoull(text.c_str(), &end, 10);
    if (errno == ERANGE || end == nullptr || *end != '\0') {
        return false;
    }
    value = static_cast<uint64_t>(parsed);
    return true;
}

namespace {

string trim(const string& s)
{
    size_t first = 0;
    size_t last = s.size();
    while (first < last && isspace(static_cast<unsigned char>(s[first]))) {
        ++first;
    }
    while (last > first && isspace(static_cast<unsigned char>(s[last - 1]))) {
        --last;
    }
    return s.substr(first, last - first);
}

size_t writeBody(char* ptr, size_t size, size_t nmemb, void* userdata)
{
    HttpResponse* response = static_cast<HttpResponse*>(userdata);
    response->body.append(ptr, size * nmemb);
    return size * nmemb;
}

size_t writeHeader(char* buffer, size_t size, size_t nitems, void* userdata)
{
    HttpResponse* response = static_cast<HttpResponse*>(userdata);
    string line(buffer, size * nitems);

    // a new status line starts a new response (100 Continue, redirects)
    if (line.compare(0, 5, "HTTP/") == 0) {
        response->headers.clear();
        return size * nitems;
    }

    size_t colon = line.find(':');
    if (colon != string::npos) {
        response->headers[trim(line.substr(0, colon))] = trim(line.substr(colon + 1));
    }
    return size * nitems;
}

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

} // namespace

CurlTransport::CurlTransport(long t_connectTimeoutSeconds, long t_timeoutSeconds,
                             long t_lowSpeedLimitBytes, long t_lowSpeedTimeSeconds)
    : curl(curl_easy_init()),
      connectTimeoutSeconds(t_connectTimeoutSeconds),
      timeoutSeconds(t_timeoutSeconds),
      lowSpeedLimitBytes(t_lowSpeedLimitBytes),
      lowSpeedTimeSeconds(t_lowSpeedTimeSeconds)
{
    if (curl == nullptr) {
        throw runtime_error("curl_easy_init failed");
    }
}

CurlTransport::~CurlTransport()
{
    if (curl) curl_easy_cleanup(curl);
}

HttpResponse CurlTransport::perform(const HttpRequest& request)
{
    auto log = logger();

    HttpResponse response;
    response.status = 0;
    char errbuf[CURL_ERROR_SIZE] = {0};

    curl_easy_reset(curl);
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, connectTimeoutSeconds);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeoutSeconds);
    // a stalled peer fails the request even without an overall timeout
    if (lowSpeedLimitBytes > 0 && lowSpeedTimeSeconds > 0) {
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, lowSpeedLimitBytes);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, lowSpeedTimeSeconds);
    }
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeBody);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, writeHeader);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response);

    if (request.method == "GET") {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    } else if (request.method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                         static_cast<curl_off_t>(request.body.size()));
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.data());
    } else {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }

    unique_ptr<curl_slist, SlistDeleter> headers;
    auto addHeader = [&headers](const string& line) {
        // returns the list head, which only changes on the first append
        curl_slist* list = curl_slist_append(headers.get(), line.c_str());
        if (list == nullptr) {
            throw TransportError("unable to build request headers");
        }
        headers.release();
        headers.reset(list);
    };
    for (auto& h : request.headers) {
        addHeader(h.first + ": " + h.second);
    }
    // chunk bodies go out without waiting for 100 Continue
    addHeader("Expect:");
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        string detail = errbuf[0] ? string(errbuf) : string(curl_easy_strerror(res));
        log->debug("{} {} failed: {}", request.method, request.url, detail);
        throw TransportError(request.method + " " + request.url + ": " + detail);
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    log->debug("{} {} -> {}", request.method, request.url, response.status);
    return response;
}

RetryingTransport::RetryingTransport(HttpTransport& t_inner, const RetryPolicy& t_policy,
                                     Sleeper t_sleeper)
    : inner(t_inner), policy(t_policy), sleeper(t_sleeper)
{
}

HttpResponse RetryingTransport::perform(const HttpRequest& request)
{
    auto log = logger();

    for (int retry = 0; ; ++retry) {
        try {
            return inner.perform(request);
        } catch (TransportError& e) {
            if (retry >= policy.retries()) {
                log->debug("giving up on {} after {} attempts", request.url, retry + 1);
                throw;
            }
            log->warn("{} (retry {} of {})", e.what(), retry + 1, policy.retries());
            sleeper(policy.delayBefore(retry + 1));
        }
    }
}
