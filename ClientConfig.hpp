#ifndef CLIENTCONFIG_HPP
#define CLIENTCONFIG_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "INIReader.h"

#include "ClusterUploadTypes.hpp"
#include "RetryPolicy.hpp"

using namespace std;

// Settings of one uploader process. Built by main and handed to the
// components by reference; defaults match a config file with no keys.
class ClientConfig {
public:
    ClientConfig();

    // Overrides the defaults with the keys present in `config`. Invalid values
    // are logged and make this return false.
    bool load(INIReader& config);

    RetryPolicy trialPolicy() const;
    RetryPolicy requestPolicy() const;

    // [uploader]
    uint64_t chunk_size;
    uint64_t max_chunk_size;
    int max_retries;
    long retry_wait_seconds;
    bool exponential_backoff;
    double backoff_multiplier;
    long max_retry_wait_seconds;
    OffsetMode offset_mode;
    bool retry_local_file_errors;
    bool retry_session_init_failures;
    bool log_digests;
    string log_level;

    // [http]
    int request_retries;
    long request_retry_wait_seconds;
    long connect_timeout_seconds;
    long timeout_seconds;
    long low_speed_limit_bytes;
    long low_speed_time_seconds;

    // [masters]
    vector<string> masters;
};

#endif // CLIENTCONFIG_HPP
