#include "wait_group.hpp"

#include <stdexcept>

namespace beagle {
void WaitGroup::add(size_t n) {
    std::lock_guard<std::mutex> lock(mu_);
    pending_ += n;
}

void WaitGroup::done() {
    bool reached_zero = false;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (pending_ == 0) throw std::logic_error("WaitGroup::done called with nothing pending");
        reached_zero = (--pending_ == 0);
    }
    if (reached_zero) zero_.notify_all();
}

void WaitGroup::wait() {
    std::unique_lock<std::mutex> lock(mu_);
    zero_.wait(lock, [this] { return pending_ == 0; });
}

size_t WaitGroup::pending() const {
    std::lock_guard<std::mutex> lock(mu_);
    return pending_;
}
}  // namespace beagle
