#pragma once

// TTL-keyed store with get-or-compute semantics.
//
// An explicit object with an explicit lifetime: whoever needs caching owns
// one (or is handed one at construction). Expiry is checked on every read;
// put() sweeps expired entries at most once per default ttl, so keys that
// are never read again do not pile up. gc() sweeps on demand. Thread-safe.

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace verigate {

template <typename V>
class TtlCache {
public:
    using Clock = std::function<int64_t()>; // epoch-ish ms, monotonic

    explicit TtlCache(int64_t default_ttl_ms, Clock clock = steady_ms)
        : default_ttl_ms_(default_ttl_ms), clock_(std::move(clock)) {}

    std::optional<V> get(const std::string& key) {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = entries_.find(key);
        if (it == entries_.end()) { misses_++; return std::nullopt; }
        if (clock_() >= it->second.expires_ms) {
            entries_.erase(it);
            misses_++;
            return std::nullopt;
        }
        hits_++;
        return it->second.value;
    }

    void put(const std::string& key, V value, int64_t ttl_ms = -1) {
        if (ttl_ms < 0) ttl_ms = default_ttl_ms_;
        std::lock_guard<std::mutex> lk(mu_);
        const int64_t now = clock_();
        if (now >= next_sweep_ms_) {
            sweep_locked(now);
            next_sweep_ms_ = now + std::max<int64_t>(default_ttl_ms_, 1);
        }
        entries_[key] = Entry{std::move(value), now + ttl_ms};
    }

    // Cached value if fresh; otherwise compute() and store its result.
    // compute returns std::nullopt to signal "nothing worth caching"; the
    // lock is not held while it runs.
    std::optional<V> get_or_compute(const std::string& key,
                                    const std::function<std::optional<V>()>& compute,
                                    int64_t ttl_ms = -1) {
        if (auto v = get(key)) return v;
        std::optional<V> fresh = compute();
        if (fresh) put(key, *fresh, ttl_ms);
        return fresh;
    }

    void erase(const std::string& key) {
        std::lock_guard<std::mutex> lk(mu_);
        entries_.erase(key);
    }

    // Drop expired entries. Returns how many were removed.
    size_t gc() {
        std::lock_guard<std::mutex> lk(mu_);
        return sweep_locked(clock_());
    }

    size_t size() const {
        std::lock_guard<std::mutex> lk(mu_);
        return entries_.size();
    }
    size_t hits() const {
        std::lock_guard<std::mutex> lk(mu_);
        return hits_;
    }
    size_t misses() const {
        std::lock_guard<std::mutex> lk(mu_);
        return misses_;
    }

    static int64_t steady_ms() {
        using namespace std::chrono;
        return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
    }

private:
    struct Entry {
        V value;
        int64_t expires_ms{0};
    };

    size_t sweep_locked(int64_t now) {
        size_t removed = 0;
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (now >= it->second.expires_ms) { it = entries_.erase(it); removed++; }
            else ++it;
        }
        return removed;
    }

    int64_t default_ttl_ms_;
    Clock clock_;
    mutable std::mutex mu_;
    std::unordered_map<std::string, Entry> entries_;
    size_t hits_{0};
    size_t misses_{0};
    int64_t next_sweep_ms_{0};
};

} // namespace verigate
