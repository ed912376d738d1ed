#include "rendezvous/rate_limiter.hh"
#include "core/logging.hh"
#include <algorithm>

namespace qx {

// ============================================================================
// TokenBucket Implementation
// ============================================================================

TokenBucket::TokenBucket(RateLimit limit, steady_time_t now)
    : limit_(limit)
    , tokens_(limit.burst)
    , last_refill_(now) {}

double TokenBucket::refilled(steady_time_t now) const {
    if (now <= last_refill_) {
        return tokens_;
    }
    std::chrono::duration<double> elapsed = now - last_refill_;
    return std::min(limit_.burst, tokens_ + elapsed.count() * limit_.rate_per_second);
}

void TokenBucket::refill(steady_time_t now) {
    if (now <= last_refill_) {
        return;
    }
    tokens_ = refilled(now);
    last_refill_ = now;
}

bool TokenBucket::try_acquire(steady_time_t now) {
    refill(now);
    if (tokens_ < 1.0) {
        return false;
    }
    tokens_ -= 1.0;
    return true;
}

double TokenBucket::available(steady_time_t now) const {
    return refilled(now);
}

// ============================================================================
// ClientRateLimiter Implementation
// ============================================================================

ClientRateLimiter::ClientRateLimiter(RateLimit limit, std::size_t prune_threshold)
    : limit_(limit)
    , min_prune_threshold_(std::max<std::size_t>(prune_threshold, 1))
    , prune_at_(min_prune_threshold_) {}

bool ClientRateLimiter::allow(const std::string& client_id) {
    return allow(client_id, std::chrono::steady_clock::now());
}

bool ClientRateLimiter::allow(const std::string& client_id, steady_time_t now) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (buckets_.size() >= prune_at_ && buckets_.find(client_id) == buckets_.end()) {
        std::size_t removed = prune_locked(now);
        prune_at_ = std::max(min_prune_threshold_, buckets_.size() * 2);
        QX_LOG_DEBUG(log::service) << "Pruned " << removed << " idle rate-limit buckets, "
                                   << buckets_.size() << " remain";
    }

    auto it = buckets_.try_emplace(client_id, limit_, now).first;
    if (!it->second.try_acquire(now)) {
        QX_LOG_DEBUG(log::service) << "Rate limited client " << client_id;
        return false;
    }
    return true;
}

std::size_t ClientRateLimiter::prune(steady_time_t now) {
    std::lock_guard<std::mutex> lock(mutex_);
    return prune_locked(now);
}

std::size_t ClientRateLimiter::prune_locked(steady_time_t now) {
    // A full bucket is indistinguishable from a fresh one
    return std::erase_if(buckets_, [this, now](const auto& kv) {
        return kv.second.available(now) >= limit_.burst;
    });
}

std::size_t ClientRateLimiter::client_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buckets_.size();
}

}  // namespace qx
