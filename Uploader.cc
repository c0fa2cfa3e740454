#include <fstream>
#include <iterator>
#include <string>

#include "picosha2.h"

#include "logger.hpp"
#include "ChunkedTransfer.hpp"
#include "SessionNegotiator.hpp"
#include "UploadErrors.hpp"
#include "Uploader.hpp"

using namespace std;

const char* uploadStateName(UploadState state)
{
    switch (state) {
        case UploadState::Idle: return "idle";
        case UploadState::SelectingMaster: return "selecting master";
        case UploadState::Negotiating: return "negotiating";
        case UploadState::Transferring: return "transferring";
        case UploadState::Success: return "success";
        case UploadState::Failed: return "failed";
    }
    return "unknown";
}

Uploader::Uploader(const ClientConfig& t_config, MasterPool& t_masters,
                   HttpTransport& t_transport, Sleeper t_sleeper)
    : config(t_config), masters(t_masters), transport(t_transport), sleeper(t_sleeper),
      currentState(UploadState::Idle), attemptCount(0)
{
}

bool Uploader::uploadVideo(const string& videoPath)
{
    return upload(videoManifest(videoPath), FileKind::Video);
}

bool Uploader::uploadModel(const string& modelPath, const string& configPath, const string& codePath)
{
    return upload(modelManifest(modelPath, configPath, codePath), FileKind::Model);
}

void Uploader::setState(UploadState next)
{
    auto log = logger();
    log->debug("Uploader: {} -> {}", uploadStateName(currentState), uploadStateName(next));
    currentState = next;
}

bool Uploader::upload(const TransferManifest& manifest, FileKind kind)
{
    auto log = logger();

    RetryPolicy policy = config.trialPolicy();
    SessionNegotiator negotiator(transport, config.chunk_size, config.max_chunk_size);
    ChunkedTransfer engine(transport, config.offset_mode, config.max_chunk_size);

    currentState = UploadState::Idle;
    attemptCount = 0;

    for (int trial = 0; trial < policy.maxAttempts(); ++trial) {
        if (trial > 0) {
            sleeper(policy.delayBefore(trial));
        }
        ++attemptCount;
        log->info("Trial {} of {}", trial + 1, policy.maxAttempts());

        setState(UploadState::SelectingMaster);
        string master = masters.select();

        setState(UploadState::Negotiating);
        string uploadAddress;
        try {
            uploadAddress = negotiator.discoverUploadAddress(master);
        } catch (MasterUnreachable& e) {
            log->warn("Can't contact master {}: {}", master, e.what());
            masters.rotate();
            continue;
        }

        try {
            SizeHeaders sizes = measureSizes(manifest, kind);
            UploadSession session = negotiator.openSession(uploadAddress, manifest.front().path,
                                                           kind, sizes);
            log->info("Sent initial request for {} with ID = {}", fileKindName(kind), session.id);

            setState(UploadState::Transferring);
            TransferStats stats = engine.send(session, manifest);

            setState(UploadState::Success);
            log->info("Upload successful: {} appends, {} bytes acknowledged, {} offset resyncs, {} chunk resizes",
                      stats.appends, stats.bytes_acked, stats.offset_resyncs, stats.chunk_resizes);
            if (config.log_digests) {
                logDigests(manifest);
            }
            return true;
        } catch (LocalFileError& e) {
            if (!config.retry_local_file_errors) {
                setState(UploadState::Failed);
                log->error("Local file error: {}", e.what());
                throw;
            }
            log->warn("Local file error: {}", e.what());
        } catch (SessionInitFailed& e) {
            if (!config.retry_session_init_failures) {
                setState(UploadState::Failed);
                log->error("Session init failed: {}", e.what());
                throw;
            }
            log->warn("Session init failed: {}", e.what());
        } catch (TransportError& e) {
            log->warn("Can't connect to node: {}", e.what());
        } catch (UploadError& e) {
            log->warn("Trial {} failed: {}", trial + 1, e.what());
        }
    }

    setState(UploadState::Failed);
    log->critical("Upload failed after {} trials", attemptCount);
    return false;
}

string Uploader::fileDigest(const string& path)
{
    ifstream file(path.c_str(), ios::in | ios::binary);
    if (!file.is_open()) {
        throw LocalFileError(path, "unable to open for hashing");
    }
    istreambuf_iterator<char> first(file), last;
    return picosha2::hash256_hex_string(first, last);
}

void Uploader::logDigests(const TransferManifest& manifest)
{
    auto log = logger();
    for (auto& entry : manifest) {
        try {
            log->info("  {} sha256 {}", entry.label, fileDigest(entry.path));
        } catch (LocalFileError& e) {
            // a digest failure does not fail the upload
            log->warn("Unable to hash {}: {}", entry.label, e.what());
        }
    }
}
