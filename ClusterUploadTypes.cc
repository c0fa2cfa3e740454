#include "ClusterUploadTypes.hpp"

const char* fileKindName(FileKind kind)
{
    switch (kind) {
        case FileKind::Video:
            return "video";
        case FileKind::Model:
            return "model";
    }
    return "unknown";
}

TransferManifest videoManifest(const string& videoPath)
{
    TransferManifest manifest;
    manifest.push_back(ManifestEntry{"video", videoPath});
    return manifest;
}

TransferManifest modelManifest(const string& modelPath, const string& configPath,
                               const string& codePath)
{
    // the data node expects this exact order
    TransferManifest manifest;
    manifest.push_back(ManifestEntry{"model", modelPath});
    manifest.push_back(ManifestEntry{"config", configPath});
    manifest.push_back(ManifestEntry{"code", codePath});
    return manifest;
}
