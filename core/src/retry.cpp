#include "verigate/retry.h"

#include <chrono>
#include <thread>

namespace verigate {

static int64_t now_ms_i64() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

int64_t backoff_delay_ms(int next_attempt, const RetryPolicy& p) {
    int64_t base_ms = p.backoff_base_ms < 0 ? 0 : p.backoff_base_ms;
    int64_t mult = p.backoff_mult < 1 ? 1 : p.backoff_mult;
    int64_t max_ms = p.backoff_max_ms < 0 ? 0 : p.backoff_max_ms;
    int64_t jitter_ms = p.jitter_ms < 0 ? 0 : p.jitter_ms;

    int exp = next_attempt - 2;
    if (exp < 0) exp = 0;
    long double d = (long double)base_ms;
    for (int i = 0; i < exp; i++) {
        d *= (long double)mult;
        if (max_ms > 0 && d > (long double)max_ms) break;
    }
    int64_t delay = (int64_t)d;
    if (max_ms > 0 && delay > max_ms) delay = max_ms;
    if (jitter_ms > 0) {
        uint64_t seed = (uint64_t)now_ms_i64();
        seed ^= (seed << 13);
        seed ^= (seed >> 7);
        seed ^= (seed << 17);
        delay += (int64_t)(seed % (uint64_t)(jitter_ms + 1));
    }
    return delay;
}

void sleep_ms(int64_t ms) {
    if (ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

bool retry_with_backoff(const RetryPolicy& p,
                        const std::function<bool(int attempt)>& fn,
                        const SleepFn& sleep,
                        int* attempts_out) {
    const int max_attempts = p.max_attempts < 1 ? 1 : p.max_attempts;
    int attempt = 0;
    bool ok = false;
    while (attempt < max_attempts) {
        attempt++;
        if (attempt > 1 && sleep) sleep(backoff_delay_ms(attempt, p));
        if (fn(attempt)) { ok = true; break; }
    }
    if (attempts_out) *attempts_out = attempt;
    return ok;
}

} // namespace verigate
