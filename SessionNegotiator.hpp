#ifndef SESSIONNEGOTIATOR_HPP
#define SESSIONNEGOTIATOR_HPP

#include <cstdint>
#include <string>

#include "ClusterUploadTypes.hpp"
#include "HttpTransport.hpp"

using namespace std;

// Size of a local file via stat. Throws LocalFileError.
uint64_t localFileSize(const string& path);

// Filesize for every kind, plus <Label>-Size per file for models.
SizeHeaders measureSizes(const TransferManifest& manifest, FileKind kind);

// Finds a data node through a master and opens an upload session on it.
class SessionNegotiator {
public:
    SessionNegotiator(HttpTransport& t_transport, uint64_t t_defaultChunkSize,
                      uint64_t t_maxChunkSize = DEFAULT_MAX_CHUNK_SIZE);

    // GET the master; the body of a 200 answer is the upload address.
    // Throws MasterUnreachable.
    string discoverUploadAddress(const string& masterAddress);

    // POST an init request for the file at `filePath` (only its base name is
    // sent). Throws SessionInitFailed on anything but 201 with an ID, and
    // TransportError when the data node cannot be reached. A Max-Request-Size
    // above the chunk size limit is lowered to the limit.
    UploadSession openSession(const string& uploadAddress, const string& filePath,
                              FileKind kind, const SizeHeaders& sizes);

protected:
    HttpTransport& transport;
    uint64_t defaultChunkSize;
    uint64_t maxChunkSize;
};

#endif // SESSIONNEGOTIATOR_HPP
