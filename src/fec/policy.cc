#include "fec/policy.hh"
#include "core/logging.hh"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace qx {

// ============================================================================
// PolicyConfig Validation
// ============================================================================

std::string PolicyConfig::validation_error() const {
    if (data_shards == 0) {
        return "data_shards must be positive";
    }
    if (min_parity == 0 || min_parity > max_parity) {
        return "parity bounds must satisfy 1 <= min_parity <= max_parity";
    }
    if (default_parity < min_parity || default_parity > max_parity) {
        return "default_parity outside [min_parity, max_parity]";
    }
    if (!std::isfinite(enable_threshold) || !std::isfinite(disable_threshold) ||
        disable_threshold < 0.0 || disable_threshold >= enable_threshold) {
        return "thresholds must satisfy 0 <= disable_threshold < enable_threshold";
    }
    if (min_observation.count() < 0) {
        return "min_observation must not be negative";
    }
    if (disable_hold_multiplier <= 1) {
        return "disable_hold_multiplier must be greater than 1";
    }
    if (!(smoothing_alpha > 0.0 && smoothing_alpha <= 1.0)) {
        return "smoothing_alpha must be in (0, 1]";
    }
    if (parity_bands.empty()) {
        return "parity_bands must not be empty";
    }
    for (std::size_t i = 0; i < parity_bands.size(); ++i) {
        const auto& band = parity_bands[i];
        if (!std::isfinite(band.lower_edge)) {
            return "parity band edges must be finite";
        }
        if (i > 0 && (band.lower_edge <= parity_bands[i - 1].lower_edge ||
                      band.parity < parity_bands[i - 1].parity)) {
            return "parity_bands must have ascending edges and non-decreasing parity";
        }
    }
    return {};
}

// ============================================================================
// AdaptivePolicy Implementation
// ============================================================================

AdaptivePolicy::AdaptivePolicy(PolicyConfig config)
    : AdaptivePolicy(std::move(config), std::chrono::steady_clock::now()) {}

AdaptivePolicy::AdaptivePolicy(PolicyConfig config, steady_time_t now)
    : config_(std::move(config))
    , r_(config_.default_parity)
    , since_(now) {
    auto error = config_.validation_error();
    if (!error.empty()) {
        log::fec.error() << "Invalid FEC policy config: " << error;
        throw std::invalid_argument("invalid FEC policy config: " + error);
    }
}

std::uint32_t AdaptivePolicy::parity_for_loss(double loss_percent) const {
    std::uint32_t parity = config_.default_parity;
    for (const auto& band : config_.parity_bands) {
        if (band.lower_edge > loss_percent) {
            break;
        }
        parity = band.parity;
    }
    return std::clamp(parity, config_.min_parity, config_.max_parity);
}

bool AdaptivePolicy::held_for(const std::optional<steady_time_t>& streak_start,
                              steady_time_t now,
                              std::chrono::nanoseconds window) const {
    if (!streak_start) {
        return false;
    }
    // A manual or automatic change restarts every hold
    steady_time_t from = std::max(*streak_start, since_);
    return now - from >= window;
}

Transition AdaptivePolicy::update(double loss_percent) {
    return update(loss_percent, std::chrono::steady_clock::now());
}

Transition AdaptivePolicy::update(double loss_percent, steady_time_t now) {
    if (std::isnan(loss_percent) || loss_percent < 0.0 || loss_percent > 100.0) {
        QX_LOG_DEBUG(log::fec) << "Rejected loss sample " << loss_percent;
        return Transition::REJECTED;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (samples_ == 0) {
        estimate_ = loss_percent;
    } else {
        estimate_ = config_.smoothing_alpha * loss_percent +
                    (1.0 - config_.smoothing_alpha) * estimate_;
    }
    samples_++;

    if (estimate_ >= config_.enable_threshold) {
        if (!above_enable_since_) above_enable_since_ = now;
    } else {
        above_enable_since_.reset();
    }
    if (estimate_ < config_.disable_threshold) {
        if (!below_disable_since_) below_disable_since_ = now;
    } else {
        below_disable_since_.reset();
    }

    if (now - since_ < config_.min_observation) {
        return Transition::NONE;
    }

    if (!enabled_) {
        if (held_for(above_enable_since_, now, config_.min_observation)) {
            enabled_ = true;
            r_ = config_.default_parity;
            since_ = now;
            log::fec.info() << "FEC enabled: k=" << config_.data_shards << " r=" << r_
                            << " (loss estimate " << estimate_ << "%)";
            return Transition::ENABLED;
        }
        return Transition::NONE;
    }

    if (held_for(below_disable_since_, now, config_.min_observation * config_.disable_hold_multiplier)) {
        enabled_ = false;
        r_ = config_.default_parity;
        since_ = now;
        log::fec.info() << "FEC disabled (loss estimate " << estimate_ << "%)";
        return Transition::DISABLED;
    }

    std::uint32_t target = parity_for_loss(estimate_);
    if (target != r_) {
        log::fec.info() << "FEC parity " << r_ << " -> " << target
                        << " (loss estimate " << estimate_ << "%)";
        r_ = target;
        since_ = now;
        return Transition::PARITY_CHANGED;
    }
    return Transition::NONE;
}

void AdaptivePolicy::set_enabled(bool enabled) {
    set_enabled(enabled, std::chrono::steady_clock::now());
}

void AdaptivePolicy::set_enabled(bool enabled, steady_time_t now) {
    std::lock_guard<std::mutex> lock(mutex_);
    enabled_ = enabled;
    since_ = now;
    QX_LOG_INFO(log::fec) << "FEC manually " << (enabled ? "enabled" : "disabled");
}

AdaptivePolicy::SetResult AdaptivePolicy::set_parity_shards(std::uint32_t r) {
    return set_parity_shards(r, std::chrono::steady_clock::now());
}

AdaptivePolicy::SetResult AdaptivePolicy::set_parity_shards(std::uint32_t r, steady_time_t now) {
    if (r < config_.min_parity || r > config_.max_parity) {
        log::fec.warn() << "Parity " << r << " outside [" << config_.min_parity
                        << ", " << config_.max_parity << "]";
        return SetResult::OUT_OF_RANGE;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    r_ = r;
    since_ = now;
    QX_LOG_INFO(log::fec) << "FEC parity manually set to " << r;
    return SetResult::SUCCESS;
}

void AdaptivePolicy::reset() {
    reset(std::chrono::steady_clock::now());
}

void AdaptivePolicy::reset(steady_time_t now) {
    std::lock_guard<std::mutex> lock(mutex_);
    reset_locked(now);
}

void AdaptivePolicy::reset_locked(steady_time_t now) {
    enabled_ = false;
    r_ = config_.default_parity;
    since_ = now;
    estimate_ = 0.0;
    samples_ = 0;
    above_enable_since_.reset();
    below_disable_since_.reset();
}

FecParameters AdaptivePolicy::get_parameters() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return FecParameters{enabled_, config_.data_shards, r_};
}

PolicyState AdaptivePolicy::get_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    PolicyState state;
    state.enabled = enabled_;
    state.k = config_.data_shards;
    state.r = r_;
    state.since = since_;
    state.loss_estimate = estimate_;
    state.samples = samples_;
    return state;
}

}  // namespace qx
