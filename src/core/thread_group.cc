#include "core/thread_group.hh"
#include "core/logging.hh"
#include <system_error>

namespace qx {

ThreadGroup::~ThreadGroup() {
    join_all();
}

bool ThreadGroup::spawn(std::function<void()> task) {
    try {
        threads_.emplace_back(std::move(task));
    } catch (const std::system_error& e) {
        log::core.error() << "Failed to start worker thread: " << e.what();
        return false;
    }
    return true;
}

void ThreadGroup::join_all() {
    for (auto& t : threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
    threads_.clear();
}

}  // namespace qx
