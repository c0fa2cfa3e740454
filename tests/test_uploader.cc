#include "Uploader.hpp"
#include "TestSupport.hpp"

#include <cassert>
#include <chrono>
#include <string>
#include <vector>

using namespace std;

namespace {

ClientConfig testConfig() {
    ClientConfig config;
    config.max_retries = 3;
    config.retry_wait_seconds = 10;
    config.chunk_size = 1024;
    config.log_digests = false;
    return config;
}

vector<string> threeMasters() {
    return vector<string>{"http://m0:8000", "http://m1:8000", "http://m2:8000"};
}

void test_video_upload_end_to_end() {
    TempDir dir;
    string data = pattern(5000);
    string video = dir.file("clip.mp4", data);

    FakeDataNode dataNode(data.size());
    ScriptedTransport transport;
    transport.thenRespond(200, HeaderMap(), "http://node:9000/upload");
    for (int i = 0; i < 10; ++i) {
        transport.then(node(dataNode));
    }

    ClientConfig config = testConfig();
    config.log_digests = true;
    MasterPool masters(threeMasters());
    SleepRecorder sleeps;
    Uploader uploader(config, masters, transport, sleeps.sleeper());

    assert(uploader.state() == UploadState::Idle);
    assert(uploader.uploadVideo(video));
    assert(uploader.state() == UploadState::Success);
    assert(uploader.attempts() == 1);
    assert(sleeps.delays.empty());
    assert(dataNode.stored == data);

    assert(transport.requests[0].url == "http://m0:8000");
    assert(transport.requests[1].url == "http://node:9000/upload");
    assert(transport.requests[1].headers.at("Filetype") == "video");
    assert(transport.requests[1].headers.at("Filesize") == "5000");
    // 5 appends of at most 1024 bytes
    assert(transport.requests.size() == 2 + 5);
}

void test_model_upload_end_to_end() {
    TempDir dir;
    string modelData = pattern(3000, 'a');
    string configData = pattern(200, 'k');
    string codeData = pattern(900, 'p');
    string model = dir.file("model.onnx", modelData);
    string cfg = dir.file("config.yaml", configData);
    string code = dir.file("code.py", codeData);

    FakeDataNode dataNode(modelData.size() + configData.size() + codeData.size());
    ScriptedTransport transport;
    transport.thenRespond(200, HeaderMap(), "http://node:9000/upload");
    HeaderMap created = header("ID", "model-7");
    created["Max-Request-Size"] = "512";
    transport.thenRespond(201, created);
    for (int i = 0; i < 20; ++i) {
        transport.then(node(dataNode));
    }

    ClientConfig config = testConfig();
    MasterPool masters(threeMasters());
    SleepRecorder sleeps;
    Uploader uploader(config, masters, transport, sleeps.sleeper());

    assert(uploader.uploadModel(model, cfg, code));
    assert(dataNode.stored == modelData + configData + codeData);

    const HttpRequest& init = transport.requests[1];
    assert(init.headers.at("Filename") == "model.onnx");
    assert(init.headers.at("Filetype") == "model");
    assert(init.headers.at("Filesize") == "4100");
    assert(init.headers.at("Model-Size") == "3000");
    assert(init.headers.at("Config-Size") == "200");
    assert(init.headers.at("Code-Size") == "900");

    // the session's chunk size suggestion applies to every append
    for (size_t i = 2; i < transport.requests.size(); ++i) {
        assert(transport.requests[i].body.size() <= 512);
        assert(transport.requests[i].headers.at("ID") == "model-7");
    }
}

void test_unreachable_master_rotates_pool() {
    TempDir dir;
    string video = dir.file("clip.mp4", pattern(100));

    ScriptedTransport transport;
    transport.thenFail("connection refused");
    transport.thenRespond(200, HeaderMap(), "http://node:9000/upload");
    transport.thenRespond(201, header("ID", "s1"));
    transport.thenRespond(201);

    ClientConfig config = testConfig();
    MasterPool masters(threeMasters());
    SleepRecorder sleeps;
    Uploader uploader(config, masters, transport, sleeps.sleeper());

    assert(uploader.uploadVideo(video));
    assert(uploader.attempts() == 2);
    assert(masters.cursor() == 1);
    assert(transport.requests[0].url == "http://m0:8000");
    assert(transport.requests[1].url == "http://m1:8000");
    assert(sleeps.delays.size() == 1);
    assert(sleeps.delays[0] == chrono::milliseconds(10000));
}

void test_exhausted_retries_report_failure() {
    TempDir dir;
    string video = dir.file("clip.mp4", pattern(100));

    ScriptedTransport transport;
    transport.thenFail("connection refused");
    transport.thenRespond(500, HeaderMap(), "not the master");
    transport.thenFail("timeout");
    transport.thenFail("connection refused");

    ClientConfig config = testConfig();
    MasterPool masters(threeMasters());
    SleepRecorder sleeps;
    Uploader uploader(config, masters, transport, sleeps.sleeper());

    assert(!uploader.uploadVideo(video));
    assert(uploader.state() == UploadState::Failed);
    assert(uploader.attempts() == 4);
    assert(transport.requests.size() == 4);
    // round robin: every master once before the first repeats
    assert(transport.requests[0].url == "http://m0:8000");
    assert(transport.requests[1].url == "http://m1:8000");
    assert(transport.requests[2].url == "http://m2:8000");
    assert(transport.requests[3].url == "http://m0:8000");
    // waits only between trials
    assert(sleeps.delays.size() == 3);
}

void test_failed_transfer_renegotiates_without_rotation() {
    TempDir dir;
    string video = dir.file("clip.mp4", pattern(100));

    ScriptedTransport transport;
    transport.thenRespond(200, HeaderMap(), "http://node-a/upload");
    transport.thenRespond(201, header("ID", "s1"));
    transport.thenRespond(500, HeaderMap(), "node going down");
    transport.thenRespond(200, HeaderMap(), "http://node-b/upload");
    transport.thenRespond(201, header("ID", "s2"));
    transport.thenRespond(201);

    ClientConfig config = testConfig();
    MasterPool masters(threeMasters());
    SleepRecorder sleeps;
    Uploader uploader(config, masters, transport, sleeps.sleeper());

    assert(uploader.uploadVideo(video));
    assert(uploader.attempts() == 2);
    assert(masters.cursor() == 0);
    assert(transport.requests[3].url == "http://m0:8000");
    assert(transport.requests[5].url == "http://node-b/upload");
    assert(transport.requests[5].headers.at("ID") == "s2");
    assert(transport.requests[5].headers.at("Offset") == "0");
}

void test_huge_chunk_request_fails_trial_cleanly() {
    TempDir dir;
    string video = dir.file("clip.mp4", pattern(100));

    ScriptedTransport transport;
    transport.thenRespond(200, HeaderMap(), "http://node-a/upload");
    transport.thenRespond(201, header("ID", "s1"));
    transport.thenRespond(413, header("Max-Request-Size", "18446744073709551615"));
    transport.thenRespond(200, HeaderMap(), "http://node-b/upload");
    HeaderMap created = header("ID", "s2");
    created["Max-Request-Size"] = "9223372036854775807";
    transport.thenRespond(201, created);
    transport.thenRespond(201);

    ClientConfig config = testConfig();
    config.max_chunk_size = 2048;
    MasterPool masters(threeMasters());
    SleepRecorder sleeps;
    Uploader uploader(config, masters, transport, sleeps.sleeper());

    assert(uploader.uploadVideo(video));
    assert(uploader.attempts() == 2);
    assert(transport.requests.size() == 6);
    assert(transport.requests[5].body.size() == 100);
}

void test_incomplete_upload_is_retried() {
    TempDir dir;
    string video = dir.file("clip.mp4", pattern(100));

    ScriptedTransport transport;
    transport.thenRespond(200, HeaderMap(), "http://node/upload");
    transport.thenRespond(201, header("ID", "s1"));
    transport.thenRespond(200);
    transport.thenRespond(200, HeaderMap(), "http://node/upload");
    transport.thenRespond(201, header("ID", "s2"));
    transport.thenRespond(201);

    ClientConfig config = testConfig();
    MasterPool masters(threeMasters());
    SleepRecorder sleeps;
    Uploader uploader(config, masters, transport, sleeps.sleeper());

    assert(uploader.uploadVideo(video));
    assert(uploader.attempts() == 2);
}

void test_local_file_error_policy() {
    TempDir dir;
    string missing = dir.missing("gone.mp4");

    ScriptedTransport fatalTransport;
    fatalTransport.thenRespond(200, HeaderMap(), "http://node/upload");
    ClientConfig fatal = testConfig();
    MasterPool masters(threeMasters());
    SleepRecorder sleeps;
    Uploader fatalUploader(fatal, masters, fatalTransport, sleeps.sleeper());

    bool threw = false;
    try {
        fatalUploader.uploadVideo(missing);
    } catch (LocalFileError&) {
        threw = true;
    }
    assert(threw);
    assert(fatalUploader.state() == UploadState::Failed);
    assert(fatalUploader.attempts() == 1);
    assert(sleeps.delays.empty());

    ScriptedTransport retryTransport;
    for (int i = 0; i < 4; ++i) {
        retryTransport.thenRespond(200, HeaderMap(), "http://node/upload");
    }
    ClientConfig retry = testConfig();
    retry.retry_local_file_errors = true;
    Uploader retryUploader(retry, masters, retryTransport, sleeps.sleeper());
    assert(!retryUploader.uploadVideo(missing));
    assert(retryUploader.attempts() == 4);
    assert(retryTransport.pending() == 0);
}

void test_session_init_failure_policy() {
    TempDir dir;
    string video = dir.file("clip.mp4", pattern(100));

    ScriptedTransport fatalTransport;
    fatalTransport.thenRespond(200, HeaderMap(), "http://node/upload");
    fatalTransport.thenRespond(507, HeaderMap(), "insufficient storage");
    ClientConfig fatal = testConfig();
    MasterPool masters(threeMasters());
    SleepRecorder sleeps;
    Uploader fatalUploader(fatal, masters, fatalTransport, sleeps.sleeper());

    bool threw = false;
    try {
        fatalUploader.uploadVideo(video);
    } catch (SessionInitFailed&) {
        threw = true;
    }
    assert(threw);

    ScriptedTransport retryTransport;
    retryTransport.thenRespond(200, HeaderMap(), "http://node/upload");
    retryTransport.thenRespond(507, HeaderMap(), "insufficient storage");
    retryTransport.thenRespond(200, HeaderMap(), "http://node/upload");
    retryTransport.thenRespond(201, header("ID", "s1"));
    retryTransport.thenRespond(201);
    ClientConfig retry = testConfig();
    retry.retry_session_init_failures = true;
    Uploader retryUploader(retry, masters, retryTransport, sleeps.sleeper());
    assert(retryUploader.uploadVideo(video));
    assert(retryUploader.attempts() == 2);
}

void test_exponential_trial_backoff() {
    TempDir dir;
    string video = dir.file("clip.mp4", pattern(100));

    ScriptedTransport transport;
    for (int i = 0; i < 4; ++i) {
        transport.thenFail("connection refused");
    }

    ClientConfig config = testConfig();
    config.exponential_backoff = true;
    config.retry_wait_seconds = 1;
    config.backoff_multiplier = 2.0;
    MasterPool masters(vector<string>{"http://m0"});
    SleepRecorder sleeps;
    Uploader uploader(config, masters, transport, sleeps.sleeper());

    assert(!uploader.uploadVideo(video));
    assert(sleeps.delays.size() == 3);
    assert(sleeps.delays[0] == chrono::milliseconds(1000));
    assert(sleeps.delays[1] == chrono::milliseconds(2000));
    assert(sleeps.delays[2] == chrono::milliseconds(4000));
}

void test_file_digest() {
    TempDir dir;
    string path = dir.file("abc.txt", "abc");
    assert(Uploader::fileDigest(path) ==
           "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    bool threw = false;
    try {
        Uploader::fileDigest(dir.missing("none"));
    } catch (LocalFileError&) {
        threw = true;
    }
    assert(threw);
}

} // namespace

int main() {
    test_video_upload_end_to_end();
    test_model_upload_end_to_end();
    test_unreachable_master_rotates_pool();
    test_exhausted_retries_report_failure();
    test_failed_transfer_renegotiates_without_rotation();
    test_huge_chunk_request_fails_trial_cleanly();
    test_incomplete_upload_is_retried();
    test_local_file_error_policy();
    test_session_init_failure_policy();
    test_exponential_trial_backoff();
    test_file_digest();
    return 0;
}
