#include <cctype>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <sys/stat.h>

#include "logger.hpp"
#include "SessionNegotiator.hpp"
#include "UploadErrors.hpp"

namespace {

string baseName(const string& path)
{
    string trimmed = path;
    while (trimmed.size() > 1 && trimmed[trimmed.size() - 1] == '/') {
        trimmed.erase(trimmed.size() - 1);
    }
    size_t slash = trimmed.find_last_of('/');
    if (slash == string::npos) {
        return trimmed;
    }
    return trimmed.substr(slash + 1);
}

string sizeHeaderName(const string& label)
{
    // "config" -> "Config-Size"
    string name = label;
    if (!name.empty()) {
        name[0] = static_cast<char>(toupper(static_cast<unsigned char>(name[0])));
    }
    return name + "-Size";
}

string trimmed(const string& s)
{
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == string::npos) {
        return "";
    }
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

} // namespace

uint64_t localFileSize(const string& path)
{
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        throw LocalFileError(path, strerror(errno));
    }
    if (!S_ISREG(st.st_mode)) {
        throw LocalFileError(path, "not a regular file");
    }
    return static_cast<uint64_t>(st.st_size);
}

SizeHeaders measureSizes(const TransferManifest& manifest, FileKind kind)
{
    SizeHeaders sizes;
    sizes.total = 0;
    for (auto& entry : manifest) {
        uint64_t size = localFileSize(entry.path);
        sizes.total += size;
        if (kind == FileKind::Model) {
            sizes.parts.push_back(make_pair(sizeHeaderName(entry.label), size));
        }
    }
    return sizes;
}

SessionNegotiator::SessionNegotiator(HttpTransport& t_transport, uint64_t t_defaultChunkSize,
                                     uint64_t t_maxChunkSize)
    : transport(t_transport), defaultChunkSize(t_defaultChunkSize), maxChunkSize(t_maxChunkSize)
{
    if (defaultChunkSize == 0) {
        throw invalid_argument("chunk size must be > 0");
    }
    if (defaultChunkSize > maxChunkSize) {
        throw invalid_argument("chunk size exceeds the chunk size limit");
    }
}

string SessionNegotiator::discoverUploadAddress(const string& masterAddress)
{
    auto log = logger();

    HttpRequest req;
    req.method = "GET";
    req.url = masterAddress;

    HttpResponse res;
    try {
        res = transport.perform(req);
    } catch (TransportError& e) {
        throw MasterUnreachable(e.what());
    }

    if (res.status != 200) {
        log->warn("Master {} answered {}: {}", masterAddress, res.status, res.body);
        throw MasterUnreachable(res.body.empty() ? "status " + to_string(res.status) : res.body);
    }

    string address = trimmed(res.body);
    if (address.empty()) {
        throw MasterUnreachable("master " + masterAddress + " returned an empty upload address");
    }

    log->info("Updated upload url to {}", address);
    return address;
}

UploadSession SessionNegotiator::openSession(const string& uploadAddress, const string& filePath,
                                             FileKind kind, const SizeHeaders& sizes)
{
    auto log = logger();

    HttpRequest req;
    req.method = "POST";
    req.url = uploadAddress;
    req.headers["Request-Type"] = "init";
    req.headers["Filename"] = baseName(filePath);
    req.headers["Filetype"] = fileKindName(kind);
    req.headers["Filesize"] = to_string(sizes.total);
    for (auto& part : sizes.parts) {
        req.headers[part.first] = to_string(part.second);
    }

    HttpResponse res = transport.perform(req);
    if (res.status != 201) {
        throw SessionInitFailed("init request to " + uploadAddress + " answered " +
                                to_string(res.status) +
                                (res.body.empty() ? string() : ": " + res.body));
    }

    UploadSession session;
    session.id = res.header("ID");
    session.upload_address = uploadAddress;
    session.chunk_size = defaultChunkSize;

    if (session.id.empty()) {
        throw SessionInitFailed("init response from " + uploadAddress + " carries no ID");
    }

    if (res.hasHeader("Max-Request-Size")) {
        uint64_t maxRequestSize = 0;
        if (res.headerAsUInt64("Max-Request-Size", maxRequestSize) && maxRequestSize > 0) {
            if (maxRequestSize > maxChunkSize) {
                log->warn("Max-Request-Size {} is above the limit, using {}", maxRequestSize, maxChunkSize);
                maxRequestSize = maxChunkSize;
            }
            session.chunk_size = maxRequestSize;
            log->info("Chunk size {}", session.chunk_size);
        } else {
            log->warn("Ignoring invalid Max-Request-Size '{}'", res.header("Max-Request-Size"));
        }
    }

    return session;
}
