#ifndef TESTSUPPORT_HPP
#define TESTSUPPORT_HPP

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <deque>
#include <fstream>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>
#include <unistd.h>

#include "HttpTransport.hpp"
#include "UploadErrors.hpp"

using namespace std;

typedef function<HttpResponse(const HttpRequest&)> Responder;

inline HttpResponse response(long status, const HeaderMap& headers = HeaderMap(),
                             const string& body = "")
{
    HttpResponse res;
    res.status = status;
    res.headers = headers;
    res.body = body;
    return res;
}

inline HeaderMap header(const string& name, const string& value)
{
    HeaderMap headers;
    headers[name] = value;
    return headers;
}

// Answers requests from a queue and records everything it was asked.
class ScriptedTransport : public HttpTransport {
public:
    void then(Responder responder) { script.push_back(responder); }

    void thenRespond(long status, const HeaderMap& headers = HeaderMap(), const string& body = "")
    {
        HttpResponse res = response(status, headers, body);
        script.push_back([res](const HttpRequest&) { return res; });
    }

    void thenFail(const string& what)
    {
        script.push_back([what](const HttpRequest&) -> HttpResponse { throw TransportError(what); });
    }

    HttpResponse perform(const HttpRequest& request) override
    {
        requests.push_back(request);
        if (script.empty()) {
            throw runtime_error("unexpected request to " + request.url);
        }
        Responder next = script.front();
        script.pop_front();
        return next(request);
    }

    size_t pending() const { return script.size(); }

    vector<HttpRequest> requests;

private:
    deque<Responder> script;
};

// Data node that keeps the bytes it accepted. Offsets are cumulative over
// the whole upload; it answers 201 once `total` bytes are stored, resyncs
// clients sending at the wrong offset and rejects oversized chunks.
class FakeDataNode {
public:
    FakeDataNode(uint64_t t_total, size_t t_maxRequestSize = 0)
        : total(t_total), maxRequestSize(t_maxRequestSize) {}

    HttpResponse operator()(const HttpRequest& request)
    {
        if (request.headers.at("Request-Type") == "init") {
            return response(201, header("ID", "node-session"));
        }
        uint64_t offset = strtoull(request.headers.at("Offset").c_str(), nullptr, 10);
        if (maxRequestSize > 0 && request.body.size() > maxRequestSize) {
            return response(413, header("Max-Request-Size", to_string(maxRequestSize)));
        }
        if (offset != stored.size()) {
            return response(409, header("Offset", to_string(stored.size())));
        }
        stored += request.body;
        return response(stored.size() >= total ? 201 : 200);
    }

    uint64_t total;
    size_t maxRequestSize;
    string stored;
};

// Bridges a FakeDataNode into a ScriptedTransport, keeping shared state.
inline Responder node(FakeDataNode& dataNode)
{
    return [&dataNode](const HttpRequest& request) { return dataNode(request); };
}

// Scratch directory removed with everything created through it.
class TempDir {
public:
    TempDir()
    {
        char pattern[] = "/tmp/clusterupload_test_XXXXXX";
        if (mkdtemp(pattern) == nullptr) {
            throw runtime_error("mkdtemp failed");
        }
        path = pattern;
    }

    ~TempDir()
    {
        for (auto& f : files) {
            unlink(f.c_str());
        }
        rmdir(path.c_str());
    }

    string file(const string& name, const string& contents)
    {
        string full = path + "/" + name;
        ofstream out(full.c_str(), ios::out | ios::binary | ios::trunc);
        out.write(contents.data(), static_cast<streamsize>(contents.size()));
        out.close();
        files.push_back(full);
        return full;
    }

    string missing(const string& name) const { return path + "/" + name; }

    string path;

private:
    vector<string> files;
};

// deterministic, non-repeating-looking payload
inline string pattern(size_t size, char seed = 'a')
{
    string data(size, '\0');
    for (size_t i = 0; i < size; ++i) {
        data[i] = static_cast<char>(seed + (i * 7 + i / 13) % 26);
    }
    return data;
}

struct SleepRecorder {
    vector<chrono::milliseconds> delays;

    Sleeper sleeper()
    {
        return [this](chrono::milliseconds d) { delays.push_back(d); };
    }
};

#endif // TESTSUPPORT_HPP
