#ifndef RETRYPOLICY_HPP
#define RETRYPOLICY_HPP

#include <chrono>
#include <functional>

using namespace std;

// Suspends the caller. Tests pass a recorder instead of the real sleep.
typedef function<void(chrono::milliseconds)> Sleeper;

void sleepFor(chrono::milliseconds delay);

// longest delay an exponential policy without maxWait grows to
extern const chrono::milliseconds MAX_RETRY_DELAY;

// Bounded number of attempts with a fixed or exponentially growing delay
// between them. Knows nothing about what is being retried.
class RetryPolicy {
public:
    RetryPolicy(int t_maxRetries, chrono::milliseconds t_wait,
                double t_multiplier = 1.0,
                chrono::milliseconds t_maxWait = chrono::milliseconds(0));

    static RetryPolicy fixed(int maxRetries, chrono::milliseconds wait);
    static RetryPolicy exponential(int maxRetries, chrono::milliseconds initialWait,
                                   double multiplier, chrono::milliseconds maxWait);

    // first attempt included
    int maxAttempts() const { return maxRetries + 1; }
    int retries() const { return maxRetries; }

    // delay to wait before retry number `retry` (1 = first retry)
    chrono::milliseconds delayBefore(int retry) const;

protected:
    int maxRetries;
    chrono::milliseconds wait;
    double multiplier;
    chrono::milliseconds maxWait; // 0 = MAX_RETRY_DELAY
};

#endif // RETRYPOLICY_HPP
