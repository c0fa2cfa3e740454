#ifndef UPLOADER_HPP
#define UPLOADER_HPP

#include <string>

#include "ClientConfig.hpp"
#include "ClusterUploadTypes.hpp"
#include "HttpTransport.hpp"
#include "MasterPool.hpp"
#include "RetryPolicy.hpp"

using namespace std;

enum class UploadState {
    Idle,
    SelectingMaster,
    Negotiating,
    Transferring,
    Success,
    Failed
};

const char* uploadStateName(UploadState state);

// Drives whole uploads: every trial picks the current master, negotiates a
// fresh session and streams the manifest. Trials are bounded by the config's
// retry policy; an unreachable master moves the pool to the next one.
class Uploader {
public:
    Uploader(const ClientConfig& t_config, MasterPool& t_masters,
             HttpTransport& t_transport, Sleeper t_sleeper = sleepFor);

    // true on success, false once every trial failed. LocalFileError and
    // SessionInitFailed escape when the config makes them fatal.
    bool uploadVideo(const string& videoPath);
    bool uploadModel(const string& modelPath, const string& configPath, const string& codePath);

    UploadState state() const { return currentState; }

    // trials made by the last upload
    int attempts() const { return attemptCount; }

    static string fileDigest(const string& path);

protected:
    bool upload(const TransferManifest& manifest, FileKind kind);
    void setState(UploadState next);
    void logDigests(const TransferManifest& manifest);

    const ClientConfig& config;
    MasterPool& masters;
    HttpTransport& transport;
    Sleeper sleeper;

    UploadState currentState;
    int attemptCount;
};

#endif // UPLOADER_HPP
