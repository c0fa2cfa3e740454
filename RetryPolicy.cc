#include <stdexcept>
#include <thread>

#include "RetryPolicy.hpp"

const chrono::milliseconds MAX_RETRY_DELAY = chrono::hours(24);

void sleepFor(chrono::milliseconds delay)
{
    if (delay.count() > 0) {
        this_thread::sleep_for(delay);
    }
}

RetryPolicy::RetryPolicy(int t_maxRetries, chrono::milliseconds t_wait,
                         double t_multiplier, chrono::milliseconds t_maxWait)
    : maxRetries(t_maxRetries), wait(t_wait), multiplier(t_multiplier), maxWait(t_maxWait)
{
    if (maxRetries < 0) {
        throw invalid_argument("max retries must be >= 0");
    }
    if (wait.count() < 0 || maxWait.count() < 0) {
        throw invalid_argument("retry wait must be >= 0");
    }
    if (multiplier < 1.0) {
        throw invalid_argument("backoff multiplier must be >= 1");
    }
}

RetryPolicy RetryPolicy::fixed(int maxRetries, chrono::milliseconds wait)
{
    return RetryPolicy(maxRetries, wait);
}

RetryPolicy RetryPolicy::exponential(int maxRetries, chrono::milliseconds initialWait,
                                     double multiplier, chrono::milliseconds maxWait)
{
    return RetryPolicy(maxRetries, initialWait, multiplier, maxWait);
}

chrono::milliseconds RetryPolicy::delayBefore(int retry) const
{
    if (multiplier == 1.0) {
        return wait;
    }
    // an uncapped exponential delay still stops growing at a day
    chrono::milliseconds ceiling = maxWait.count() > 0 ? maxWait : MAX_RETRY_DELAY;
    if (wait >= ceiling) {
        return ceiling;
    }

    double delay = static_cast<double>(wait.count());
    for (int i = 1; i < retry; ++i) {
        delay *= multiplier;
        if (delay >= static_cast<double>(ceiling.count())) {
            return ceiling;
        }
    }
    return chrono::milliseconds(static_cast<chrono::milliseconds::rep>(delay));
}
