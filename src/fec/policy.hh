#pragma once

#include "core/types.hh"
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace qx {

// ============================================================================
// Policy Configuration
// ============================================================================

// Parity used while the smoothed loss is at or above lower_edge (percent)
struct ParityBand {
    double lower_edge = 0.0;
    std::uint32_t parity = DEFAULT_PARITY_SHARDS;

    bool operator==(const ParityBand&) const = default;
};

struct PolicyConfig {
    // Loss percentages; disable must sit strictly below enable
    double enable_threshold = 1.0;
    double disable_threshold = 0.2;

    // Minimum hold time before any change; disabling holds this times the multiplier
    std::chrono::milliseconds min_observation = std::chrono::seconds(30);
    std::uint32_t disable_hold_multiplier = 10;

    std::uint32_t data_shards = DEFAULT_DATA_SHARDS;
    std::uint32_t default_parity = DEFAULT_PARITY_SHARDS;
    std::uint32_t min_parity = MIN_PARITY_SHARDS;
    std::uint32_t max_parity = MAX_PARITY_SHARDS;

    // EMA weight of the newest sample, in (0, 1]
    double smoothing_alpha = 0.3;

    // Ascending lower edges with non-decreasing parity
    std::vector<ParityBand> parity_bands = {{0.0, 2}, {3.0, 3}, {5.0, 4}};

    // Empty when the config is usable, otherwise the first problem found
    [[nodiscard]] std::string validation_error() const;
    [[nodiscard]] bool validate() const { return validation_error().empty(); }
};

// ============================================================================
// Policy Outputs
// ============================================================================

struct FecParameters {
    bool enabled = false;
    std::uint32_t k = DEFAULT_DATA_SHARDS;
    std::uint32_t r = DEFAULT_PARITY_SHARDS;

    bool operator==(const FecParameters&) const = default;
};

struct PolicyState {
    bool enabled = false;
    std::uint32_t k = DEFAULT_DATA_SHARDS;
    std::uint32_t r = DEFAULT_PARITY_SHARDS;
    steady_time_t since{};        // Last state or parameter change
    double loss_estimate = 0.0;   // Smoothed loss percent
    std::uint64_t samples = 0;    // Accepted samples since construction or reset
};

enum class Transition : std::uint8_t {
    NONE,
    ENABLED,
    DISABLED,
    PARITY_CHANGED,
    REJECTED,   // Sample outside [0, 100] or NaN; state untouched
};

[[nodiscard]] inline std::string_view transition_string(Transition t) {
    switch (t) {
        case Transition::NONE: return "none";
        case Transition::ENABLED: return "enabled";
        case Transition::DISABLED: return "disabled";
        case Transition::PARITY_CHANGED: return "parity_changed";
        case Transition::REJECTED: return "rejected";
    }
    return "unknown";
}

// ============================================================================
// Adaptive Policy
// ============================================================================

// Decides whether FEC is on and how many parity shards to add from a stream
// of loss measurements. Hysteresis: enabling needs the estimate at or above
// enable_threshold for min_observation, disabling needs it below
// disable_threshold for min_observation * disable_hold_multiplier, and
// nothing changes within min_observation of the previous change.
class AdaptivePolicy {
public:
    // Throws std::invalid_argument if config.validate() fails
    explicit AdaptivePolicy(PolicyConfig config = PolicyConfig{});
    AdaptivePolicy(PolicyConfig config, steady_time_t now);

    AdaptivePolicy(const AdaptivePolicy&) = delete;
    AdaptivePolicy& operator=(const AdaptivePolicy&) = delete;

    Transition update(double loss_percent);
    Transition update(double loss_percent, steady_time_t now);

    // Manual overrides; both restart the hold window
    void set_enabled(bool enabled);
    void set_enabled(bool enabled, steady_time_t now);

    enum class SetResult {
        SUCCESS,
        OUT_OF_RANGE,
    };
    SetResult set_parity_shards(std::uint32_t r);
    SetResult set_parity_shards(std::uint32_t r, steady_time_t now);

    // Back to construction defaults; discards the estimate and streaks
    void reset();
    void reset(steady_time_t now);

    [[nodiscard]] FecParameters get_parameters() const;
    [[nodiscard]] PolicyState get_state() const;

    [[nodiscard]] const PolicyConfig& config() const { return config_; }

    // Band table lookup clamped to [min_parity, max_parity]
    [[nodiscard]] std::uint32_t parity_for_loss(double loss_percent) const;

private:
    void reset_locked(steady_time_t now);
    [[nodiscard]] bool held_for(const std::optional<steady_time_t>& streak_start,
                                steady_time_t now,
                                std::chrono::nanoseconds window) const;

    const PolicyConfig config_;

    mutable std::mutex mutex_;
    bool enabled_ = false;
    std::uint32_t r_;
    steady_time_t since_;
    double estimate_ = 0.0;
    std::uint64_t samples_ = 0;

    // Start of the current run of estimates on each side of the thresholds
    std::optional<steady_time_t> above_enable_since_;
    std::optional<steady_time_t> below_disable_since_;
};

}  // namespace qx
