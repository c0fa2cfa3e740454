#include <stdexcept>

#include "logger.hpp"
#include "ChunkedTransfer.hpp"
#include "SessionNegotiator.hpp"
#include "UploadErrors.hpp"

ChunkedTransfer::ChunkedTransfer(HttpTransport& t_transport, OffsetMode t_mode,
                                 uint64_t t_maxChunkSize)
    : transport(t_transport), mode(t_mode), maxChunkSize(t_maxChunkSize)
{
    transferState.file_index = 0;
    transferState.offset = 0;
}

TransferStats ChunkedTransfer::send(UploadSession& session, const TransferManifest& manifest)
{
    auto log = logger();

    if (manifest.empty()) {
        throw invalid_argument("nothing to upload: empty manifest");
    }
    if (session.chunk_size == 0) {
        throw invalid_argument("chunk size must be > 0");
    }
    if (session.chunk_size > maxChunkSize) {
        throw invalid_argument("chunk size exceeds the chunk size limit");
    }

    fileSizes.clear();
    fileStarts.clear();
    uint64_t total = 0;
    for (auto& entry : manifest) {
        uint64_t size = localFileSize(entry.path);
        fileStarts.push_back(total);
        fileSizes.push_back(size);
        total += size;
    }

    TransferStats stats = {0, 0, 0, 0};
    transferState.file_index = 0;
    transferState.offset = 0;

    vector<char> buffer(static_cast<size_t>(session.chunk_size));

    while (transferState.file_index < manifest.size()) {
        const ManifestEntry& entry = manifest[transferState.file_index];
        const bool lastFile = transferState.file_index + 1 == manifest.size();

        // one open file at a time, closed when this scope is left
        ifstream file(entry.path.c_str(), ios::in | ios::binary);
        if (!file.is_open()) {
            throw LocalFileError(entry.path, "unable to open for reading");
        }
        log->info("Uploading {} {}", entry.label, entry.path);
        seek(file, entry, filePosition());

        bool reopen = false;
        while (!reopen) {
            file.read(buffer.data(), static_cast<streamsize>(buffer.size()));
            if (file.bad()) {
                throw LocalFileError(entry.path, "read failed");
            }
            size_t bytesRead = static_cast<size_t>(file.gcount());
            file.clear();

            if (bytesRead == 0) {
                if (filePosition() != fileSizes[transferState.file_index]) {
                    throw LocalFileError(entry.path, "file changed size during upload");
                }
                if (lastFile) {
                    throw IncompleteUploadError("reached the end of " + entry.path +
                                                " without a completion from the server (offset " +
                                                to_string(transferState.offset) + ")");
                }
                ++transferState.file_index;
                if (mode == OffsetMode::PerFile) {
                    transferState.offset = 0;
                }
                break;
            }

            HttpRequest req;
            req.method = "POST";
            req.url = session.upload_address;
            req.headers["Request-Type"] = "APPEND";
            req.headers["ID"] = session.id;
            req.headers["Offset"] = to_string(transferState.offset);
            req.body.assign(buffer.data(), bytesRead);

            HttpResponse res = transport.perform(req);
            ++stats.appends;

            if (res.status == 201) {
                transferState.offset += bytesRead;
                stats.bytes_acked += bytesRead;
                log->info("Upload of session {} completed while sending {}", session.id, entry.label);
                return stats;
            }

            if (res.status == 200) {
                transferState.offset += bytesRead;
                stats.bytes_acked += bytesRead;
                log->debug("Chunk acknowledged, offset {}", transferState.offset);
                continue;
            }

            uint64_t value = 0;
            if (res.headerAsUInt64("Offset", value)) {
                log->warn("Offset error: changing from {} to {}", transferState.offset, value);
                ++stats.offset_resyncs;
                size_t target = locate(value, res.status);
                transferState.offset = value;
                if (target != transferState.file_index) {
                    transferState.file_index = target;
                    reopen = true;
                } else {
                    seek(file, entry, filePosition());
                }
                continue;
            }

            if (res.headerAsUInt64("Max-Request-Size", value)) {
                if (value == 0) {
                    throw ProtocolError(res.status, "server requested a chunk size of 0");
                }
                if (value > maxChunkSize) {
                    throw ProtocolError(res.status, "server requested a chunk size of " + to_string(value) +
                                        ", above the limit of " + to_string(maxChunkSize));
                }
                log->warn("Chunk size error: changing from {} to {}", buffer.size(), value);
                ++stats.chunk_resizes;
                session.chunk_size = value;
                vector<char>(static_cast<size_t>(value)).swap(buffer);
                seek(file, entry, filePosition());
                continue;
            }

            throw ProtocolError(res.status, "append to " + session.upload_address + " answered " +
                                to_string(res.status) +
                                (res.body.empty() ? string() : ": " + res.body));
        }
    }

    throw IncompleteUploadError("all files sent without a completion from the server");
}

size_t ChunkedTransfer::locate(uint64_t offset, long status) const
{
    const size_t current = transferState.file_index;

    if (mode == OffsetMode::PerFile) {
        if (offset > fileSizes[current]) {
            throw ProtocolError(status, "server offset " + to_string(offset) +
                                " is beyond the file size " + to_string(fileSizes[current]));
        }
        return current;
    }

    const uint64_t total = fileStarts.back() + fileSizes.back();
    if (offset > total) {
        throw ProtocolError(status, "server offset " + to_string(offset) +
                            " is beyond the upload size " + to_string(total));
    }
    if (offset >= fileStarts[current] && offset <= fileStarts[current] + fileSizes[current]) {
        return current;
    }
    for (size_t i = 0; i < fileSizes.size(); ++i) {
        if (offset < fileStarts[i] + fileSizes[i]) {
            return i;
        }
    }
    return fileSizes.size() - 1;
}

uint64_t ChunkedTransfer::filePosition() const
{
    if (mode == OffsetMode::PerFile) {
        return transferState.offset;
    }
    return transferState.offset - fileStarts[transferState.file_index];
}

void ChunkedTransfer::seek(ifstream& file, const ManifestEntry& entry, uint64_t position) const
{
    file.seekg(static_cast<streamoff>(position), ios::beg);
    if (file.fail()) {
        throw LocalFileError(entry.path, "unable to seek to " + to_string(position));
    }
}
