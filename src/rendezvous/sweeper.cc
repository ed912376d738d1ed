#include "rendezvous/sweeper.hh"
#include "core/logging.hh"
#include <pthread.h>

namespace qx {

ExpirySweeper::ExpirySweeper(TokenRegistry& tokens, SweeperConfig config)
    : tokens_(tokens)
    , config_(std::move(config)) {}

ExpirySweeper::~ExpirySweeper() {
    stop();
}

void ExpirySweeper::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_.load()) {
            log::sweeper.warn("Sweeper already running");
            return;
        }

        // A thread still being joined by a concurrent stop() sees the
        // generation change and exits on its own
        std::uint64_t generation = ++generation_;
        sweep_thread_ = std::thread(&ExpirySweeper::run_loop, this, generation);
        running_.store(true);
    }

    log::sweeper.info() << "Starting expiry sweeper, interval " << config_.interval.count() << "ms";
}

void ExpirySweeper::stop() {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.exchange(false)) {
            return;  // Not running
        }
        ++generation_;
        worker = std::move(sweep_thread_);
    }

    cv_.notify_all();
    if (worker.joinable()) {
        worker.join();
    }

    log::sweeper.info() << "Expiry sweeper stopped after " << sweeps_.load()
                        << " sweeps, " << total_removed_.load() << " tokens removed";
}

std::size_t ExpirySweeper::sweep_now() {
    std::size_t removed = tokens_.cleanup_expired();
    sweeps_.fetch_add(1);
    total_removed_.fetch_add(removed);

    if (removed > 0) {
        log::sweeper.info() << "Swept " << removed << " expired tokens";
    }
    if (config_.after_sweep) {
        config_.after_sweep();
    }
    return removed;
}

void ExpirySweeper::run_loop(std::uint64_t generation) {
#ifdef __linux__
    // Linux limits thread names to 15 characters
    if (!config_.thread_name.empty() &&
        pthread_setname_np(pthread_self(), config_.thread_name.substr(0, 15).c_str()) != 0) {
        log::sweeper.debug() << "Could not set thread name " << config_.thread_name;
    }
#endif

    std::unique_lock<std::mutex> lock(mutex_);
    auto stopped = [this, generation] { return generation_ != generation; };
    while (!stopped()) {
        if (cv_.wait_for(lock, config_.interval, stopped)) {
            break;
        }
        lock.unlock();
        sweep_now();
        lock.lock();
    }
}

}  // namespace qx
