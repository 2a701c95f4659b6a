#pragma once

#include <cstdint>
#include <functional>

namespace verigate {

// Exponential backoff: delay before attempt n (n >= 2) is
// base * mult^(n-2), capped at max_ms, plus up to jitter_ms.
struct RetryPolicy {
    int max_attempts{3};
    int64_t backoff_base_ms{250};
    int64_t backoff_mult{2};
    int64_t backoff_max_ms{5000};
    int64_t jitter_ms{0};
};

int64_t backoff_delay_ms(int next_attempt, const RetryPolicy& p);

using SleepFn = std::function<void(int64_t ms)>;

void sleep_ms(int64_t ms);

// Call fn(attempt) (1-based) until it returns true or max_attempts is
// reached, sleeping with backoff between attempts. Returns whether an
// attempt succeeded; *attempts_out receives the number of calls made.
bool retry_with_backoff(const RetryPolicy& p,
                        const std::function<bool(int attempt)>& fn,
                        const SleepFn& sleep = sleep_ms,
                        int* attempts_out = nullptr);

} // namespace verigate
