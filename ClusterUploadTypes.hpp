#ifndef CLUSTERUPLOADTYPES_HPP
#define CLUSTERUPLOADTYPES_HPP

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

using namespace std;

// content kind announced in the Filetype header
enum class FileKind { Video, Model };

const char* fileKindName(FileKind kind);

// how the Offset header behaves across the files of a manifest
enum class OffsetMode {
    Cumulative, // offset keeps growing across files
    PerFile     // offset restarts at zero for every file
};

struct ManifestEntry {
    string label;
    string path;
};

// ordered (label, path) pairs, sent strictly in this order
typedef vector<ManifestEntry> TransferManifest;

TransferManifest videoManifest(const string& videoPath);
TransferManifest modelManifest(const string& modelPath, const string& configPath,
                               const string& codePath);

struct SizeHeaders {
    uint64_t total;
    // (header name, bytes), e.g. ("Model-Size", 1024)
    vector<pair<string, uint64_t>> parts;
};

// largest chunk a server may ask for; one chunk is held in memory
static const uint64_t DEFAULT_MAX_CHUNK_SIZE = 64 << 20; // 64 MB

struct UploadSession {
    string id;
    string upload_address;
    uint64_t chunk_size;
};

struct TransferState {
    size_t file_index;
    uint64_t offset;
};

struct TransferStats {
    uint64_t appends;
    uint64_t bytes_acked;
    uint64_t offset_resyncs;
    uint64_t chunk_resizes;
};

#endif // CLUSTERUPLOADTYPES_HPP
