#ifndef CHUNKEDTRANSFER_HPP
#define CHUNKEDTRANSFER_HPP

#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

#include "ClusterUploadTypes.hpp"
#include "HttpTransport.hpp"

using namespace std;

// Streams the files of a manifest, in order, to an open upload session with
// APPEND requests. The server steers the transfer through the answer to each
// chunk:
//
//   200                     chunk acknowledged, offset advances
//   201                     whole upload complete, stop at once
//   other + Offset          resync to the server's offset and resend from there
//   other + Max-Request-Size  shrink or grow the chunk and resend
//   anything else           ProtocolError
//
// Offset and chunk-size corrections are handled here and never reach the caller.
class ChunkedTransfer {
public:
    ChunkedTransfer(HttpTransport& t_transport, OffsetMode t_mode,
                    uint64_t t_maxChunkSize = DEFAULT_MAX_CHUNK_SIZE);

    // Returns once the server answered 201. Throws IncompleteUploadError when
    // the last file runs out first, LocalFileError, TransportError or
    // ProtocolError otherwise. session.chunk_size follows server corrections;
    // a correction above the chunk size limit is a ProtocolError.
    TransferStats send(UploadSession& session, const TransferManifest& manifest);

    // position reached by the last send(), for diagnostics
    const TransferState& state() const { return transferState; }

protected:
    // index of the file holding `offset`, preferring the current one
    size_t locate(uint64_t offset, long status) const;

    // byte position inside the current file for the current offset
    uint64_t filePosition() const;

    void seek(ifstream& file, const ManifestEntry& entry, uint64_t position) const;

    HttpTransport& transport;
    OffsetMode mode;
    uint64_t maxChunkSize;

    TransferState transferState;
    vector<uint64_t> fileSizes;
    vector<uint64_t> fileStarts; // offset of each file within the whole upload
};

#endif // CHUNKEDTRANSFER_HPP
