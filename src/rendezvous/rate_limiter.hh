#pragma once

#include "core/types.hh"
#include <mutex>
#include <string>
#include <unordered_map>

namespace qx {

// Sustained rate plus burst capacity of one token bucket
struct RateLimit {
    double rate_per_second = 1.0;
    double burst = 1.0;

    [[nodiscard]] static RateLimit per_minute(std::uint32_t n) {
        return RateLimit{static_cast<double>(n) / 60.0, static_cast<double>(n)};
    }
    [[nodiscard]] static RateLimit per_hour(std::uint32_t n) {
        return RateLimit{static_cast<double>(n) / 3600.0, static_cast<double>(n)};
    }
};

// Refill-on-demand token bucket; starts full. Not thread-safe on its own.
class TokenBucket {
public:
    TokenBucket(RateLimit limit, steady_time_t now);

    // Takes one token if available
    [[nodiscard]] bool try_acquire(steady_time_t now);

    // Tokens a try_acquire at `now` would see; does not change the bucket
    [[nodiscard]] double available(steady_time_t now) const;
    [[nodiscard]] const RateLimit& limit() const { return limit_; }

private:
    void refill(steady_time_t now);
    [[nodiscard]] double refilled(steady_time_t now) const;

    RateLimit limit_;
    double tokens_;
    steady_time_t last_refill_;
};

// One bucket per client id, created on first use. Once the map reaches
// prune_threshold entries, adding a client first drops idle buckets, and the
// threshold then tracks twice the surviving count.
class ClientRateLimiter {
public:
    static constexpr std::size_t DEFAULT_PRUNE_THRESHOLD = 4096;

    explicit ClientRateLimiter(RateLimit limit, std::size_t prune_threshold = DEFAULT_PRUNE_THRESHOLD);

    [[nodiscard]] bool allow(const std::string& client_id);
    [[nodiscard]] bool allow(const std::string& client_id, steady_time_t now);

    // Drops buckets that have refilled to capacity
    std::size_t prune(steady_time_t now);

    [[nodiscard]] std::size_t client_count() const;
    [[nodiscard]] const RateLimit& limit() const { return limit_; }

private:
    std::size_t prune_locked(steady_time_t now);

    RateLimit limit_;
    std::size_t min_prune_threshold_;
    std::size_t prune_at_;
    std::unordered_map<std::string, TokenBucket> buckets_;
    mutable std::mutex mutex_;
};

}  // namespace qx
