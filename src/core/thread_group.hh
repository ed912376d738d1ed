#pragma once

#include <cstddef>
#include <functional>
#include <thread>
#include <vector>

namespace qx {

// Owns a set of worker threads and joins every one of them when it goes out
// of scope, including during stack unwinding.
class ThreadGroup {
public:
    ThreadGroup() = default;
    ~ThreadGroup();

    ThreadGroup(const ThreadGroup&) = delete;
    ThreadGroup& operator=(const ThreadGroup&) = delete;

    void reserve(std::size_t n) { threads_.reserve(n); }

    // False if the system refused to create the thread; threads already
    // started keep running and are still joined
    [[nodiscard]] bool spawn(std::function<void()> task);

    // Idempotent
    void join_all();

    [[nodiscard]] std::size_t size() const { return threads_.size(); }

private:
    std::vector<std::thread> threads_;
};

}  // namespace qx
