#include <string>

#include "logger.hpp"
#include "ClientConfig.hpp"

static const uint64_t DEFAULT_CHUNK_SIZE = 4 << 20; // 4 MB
static const int DEFAULT_MAX_RETRIES = 3;
static const long DEFAULT_WAITING_TIME = 10; // seconds

ClientConfig::ClientConfig()
    : chunk_size(DEFAULT_CHUNK_SIZE),
      max_chunk_size(DEFAULT_MAX_CHUNK_SIZE),
      max_retries(DEFAULT_MAX_RETRIES),
      retry_wait_seconds(DEFAULT_WAITING_TIME),
      exponential_backoff(false),
      backoff_multiplier(2.0),
      max_retry_wait_seconds(0),
      offset_mode(OffsetMode::Cumulative),
      retry_local_file_errors(false),
      retry_session_init_failures(false),
      log_digests(true),
      log_level("info"),
      request_retries(DEFAULT_MAX_RETRIES),
      request_retry_wait_seconds(DEFAULT_WAITING_TIME),
      connect_timeout_seconds(30),
      timeout_seconds(0),
      low_speed_limit_bytes(1),
      low_speed_time_seconds(60)
{
}

static bool readPolicy(INIReader& config, const string& name, bool& retry)
{
    auto log = logger();

    string value = config.Get("uploader", name, retry ? "retry" : "fatal");
    if (value == "retry") {
        retry = true;
    } else if (value == "fatal") {
        retry = false;
    } else {
        log->error("Invalid {}: {} (expected fatal or retry)", name, value);
        return false;
    }
    return true;
}

bool ClientConfig::load(INIReader& config)
{
    auto log = logger();

    long chunk = config.GetInteger("uploader", "chunk_size", static_cast<long>(chunk_size));
    if (chunk <= 0) {
        log->error("Invalid chunk size: {}", chunk);
        return false;
    }
    chunk_size = static_cast<uint64_t>(chunk);

    long maxChunk = config.GetInteger("uploader", "max_chunk_size", static_cast<long>(max_chunk_size));
    if (maxChunk <= 0 || static_cast<uint64_t>(maxChunk) < chunk_size) {
        log->error("Invalid max_chunk_size: {} (must be >= chunk_size {})", maxChunk, chunk_size);
        return false;
    }
    max_chunk_size = static_cast<uint64_t>(maxChunk);

    long retries = config.GetInteger("uploader", "max_retries", max_retries);
    if (retries < 0) {
        log->error("Invalid max_retries: {}", retries);
        return false;
    }
    max_retries = static_cast<int>(retries);

    retry_wait_seconds = config.GetInteger("uploader", "retry_wait_seconds", retry_wait_seconds);
    if (retry_wait_seconds < 0) {
        log->error("Invalid retry_wait_seconds: {}", retry_wait_seconds);
        return false;
    }

    string backoff = config.Get("uploader", "backoff", exponential_backoff ? "exponential" : "fixed");
    if (backoff == "fixed") {
        exponential_backoff = false;
    } else if (backoff == "exponential") {
        exponential_backoff = true;
    } else {
        log->error("Invalid backoff: {} (expected fixed or exponential)", backoff);
        return false;
    }

    backoff_multiplier = config.GetReal("uploader", "backoff_multiplier", backoff_multiplier);
    if (backoff_multiplier < 1.0) {
        log->error("Invalid backoff_multiplier: {}", backoff_multiplier);
        return false;
    }

    max_retry_wait_seconds = config.GetInteger("uploader", "max_retry_wait_seconds", max_retry_wait_seconds);
    if (max_retry_wait_seconds < 0) {
        log->error("Invalid max_retry_wait_seconds: {}", max_retry_wait_seconds);
        return false;
    }

    string offsets = config.Get("uploader", "offset_mode",
                                offset_mode == OffsetMode::PerFile ? "per_file" : "cumulative");
    if (offsets == "cumulative") {
        offset_mode = OffsetMode::Cumulative;
    } else if (offsets == "per_file") {
        offset_mode = OffsetMode::PerFile;
    } else {
        log->error("Invalid offset_mode: {} (expected cumulative or per_file)", offsets);
        return false;
    }

    if (!readPolicy(config, "local_file_errors", retry_local_file_errors) ||
        !readPolicy(config, "session_init_failures", retry_session_init_failures)) {
        return false;
    }

    log_digests = config.GetBoolean("uploader", "log_digests", log_digests);

    log_level = config.Get("uploader", "log_level", log_level);
    if (!setLogLevel(log_level)) {
        log->error("Invalid log_level: {}", log_level);
        return false;
    }

    long requestRetries = config.GetInteger("http", "request_retries", request_retries);
    if (requestRetries < 0) {
        log->error("Invalid request_retries: {}", requestRetries);
        return false;
    }
    request_retries = static_cast<int>(requestRetries);

    request_retry_wait_seconds = config.GetInteger("http", "request_retry_wait_seconds",
                                                   request_retry_wait_seconds);
    connect_timeout_seconds = config.GetInteger("http", "connect_timeout_seconds", connect_timeout_seconds);
    timeout_seconds = config.GetInteger("http", "timeout_seconds", timeout_seconds);
    low_speed_limit_bytes = config.GetInteger("http", "low_speed_limit_bytes", low_speed_limit_bytes);
    low_speed_time_seconds = config.GetInteger("http", "low_speed_time_seconds", low_speed_time_seconds);
    if (request_retry_wait_seconds < 0 || connect_timeout_seconds < 0 || timeout_seconds < 0 ||
        low_speed_limit_bytes < 0 || low_speed_time_seconds < 0) {
        log->error("Invalid [http] timing: values must be >= 0");
        return false;
    }

    long num_masters = config.GetInteger("masters", "num_masters", 0);
    if (num_masters < 0) {
        log->error("num_masters {} is invalid", num_masters);
        return false;
    }
    masters.clear();
    for (long i = 0; i < num_masters; ++i) {
        string master = config.Get("masters", "master" + to_string(i), "");
        if (master == "") {
            log->error("Master {} not found in config file", i);
            return false;
        }
        log->info("  Master {}= {}", i, master);
        masters.push_back(master);
    }

    log->info("Using a chunk size of {}", chunk_size);
    log->info("Using {} retries, {} s apart ({} backoff)", max_retries, retry_wait_seconds, backoff);
    return true;
}

RetryPolicy ClientConfig::trialPolicy() const
{
    if (exponential_backoff) {
        return RetryPolicy::exponential(max_retries, chrono::seconds(retry_wait_seconds),
                                        backoff_multiplier, chrono::seconds(max_retry_wait_seconds));
    }
    return RetryPolicy::fixed(max_retries, chrono::seconds(retry_wait_seconds));
}

RetryPolicy ClientConfig::requestPolicy() const
{
    return RetryPolicy::fixed(request_retries, chrono::seconds(request_retry_wait_seconds));
}
