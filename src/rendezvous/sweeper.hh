#pragma once

#include "core/types.hh"
#include "rendezvous/registry.hh"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace qx {

struct SweeperConfig {
    std::chrono::milliseconds interval = DEFAULT_SWEEP_INTERVAL;

    // Name for the thread (for debugging)
    std::string thread_name = "qx-sweeper";

    // Extra housekeeping run after every sweep, on the sweeping thread
    std::function<void()> after_sweep;
};

// Periodically removes expired tokens from a TokenRegistry on a background thread
class ExpirySweeper {
public:
    explicit ExpirySweeper(TokenRegistry& tokens, SweeperConfig config = SweeperConfig{});
    ~ExpirySweeper();

    ExpirySweeper(const ExpirySweeper&) = delete;
    ExpirySweeper& operator=(const ExpirySweeper&) = delete;

    // Idempotent and safe to call from any thread; stop() wakes the thread
    // instead of waiting out the interval
    void start();
    void stop();

    [[nodiscard]] bool is_running() const { return running_.load(); }

    // Sweeps on the calling thread; returns entries removed
    std::size_t sweep_now();

    [[nodiscard]] std::uint64_t total_removed() const { return total_removed_.load(); }
    [[nodiscard]] std::uint64_t sweep_count() const { return sweeps_.load(); }
    [[nodiscard]] std::chrono::milliseconds interval() const { return config_.interval; }

private:
    void run_loop(std::uint64_t generation);

    TokenRegistry& tokens_;
    SweeperConfig config_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> running_{false};
    std::uint64_t generation_ = 0;  // Bumped by every start/stop; guarded by mutex_
    std::thread sweep_thread_;      // Guarded by mutex_

    std::atomic<std::uint64_t> total_removed_{0};
    std::atomic<std::uint64_t> sweeps_{0};
};

}  // namespace qx
