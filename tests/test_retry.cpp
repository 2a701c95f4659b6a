#include "test_common.h"
#include "verigate/retry.h"

#include <vector>

using namespace verigate;

int main() {
    RetryPolicy p;
    p.max_attempts = 4;
    p.backoff_base_ms = 250;
    p.backoff_mult = 2;
    p.backoff_max_ms = 5000;
    p.jitter_ms = 0;

    // Delay schedule
    expect_eq_ll(backoff_delay_ms(2, p), 250, "first retry waits base");
    expect_eq_ll(backoff_delay_ms(3, p), 500, "second retry doubles");
    expect_eq_ll(backoff_delay_ms(4, p), 1000, "third retry doubles again");
    expect_eq_ll(backoff_delay_ms(20, p), 5000, "capped at max");

    {
        RetryPolicy j = p;
        j.jitter_ms = 100;
        int64_t d = backoff_delay_ms(2, j);
        expect_true(d >= 250 && d <= 350, "jitter stays within bound");
    }

    // Succeeds on third attempt; sleeps recorded, never slept for real
    {
        std::vector<int64_t> slept;
        int calls = 0;
        int attempts = 0;
        bool ok = retry_with_backoff(p, [&](int attempt) {
            calls++;
            expect_eq_ll(attempt, calls, "attempt numbers are 1-based and sequential");
            return attempt == 3;
        }, [&](int64_t ms) { slept.push_back(ms); }, &attempts);
        expect_true(ok, "eventually succeeds");
        expect_eq_ll(attempts, 3, "three attempts made");
        expect_eq_ll((long long)slept.size(), 2, "slept between attempts only");
        expect_eq_ll(slept[0], 250, "first sleep");
        expect_eq_ll(slept[1], 500, "second sleep");
    }

    // Gives up after max_attempts
    {
        int calls = 0;
        int attempts = 0;
        bool ok = retry_with_backoff(p, [&](int) { calls++; return false; },
                                     [](int64_t) {}, &attempts);
        expect_true(!ok, "all attempts fail");
        expect_eq_ll(calls, 4, "called max_attempts times");
        expect_eq_ll(attempts, 4, "attempts_out reports max");
    }

    // First-try success does not sleep
    {
        int sleeps = 0;
        bool ok = retry_with_backoff(p, [](int) { return true; }, [&](int64_t) { sleeps++; });
        expect_true(ok, "immediate success");
        expect_eq_ll(sleeps, 0, "no sleep on first success");
    }

    // Nonsensical policy still makes one attempt
    {
        RetryPolicy z;
        z.max_attempts = 0;
        int calls = 0;
        bool ok = retry_with_backoff(z, [&](int) { calls++; return false; }, [](int64_t) {});
        expect_true(!ok, "zero-attempt policy fails");
        expect_eq_ll(calls, 1, "at least one attempt");
    }

    std::cerr << "test_retry: ALL PASSED" << std::endl;
    return 0;
}
