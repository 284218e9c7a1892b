#pragma once
#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace beagle {
// Completion barrier: add() before launching work, done() as the worker's
// last action, wait() until the pending count is back to zero.
class WaitGroup {
   public:
    WaitGroup() = default;
    WaitGroup(const WaitGroup&) = delete;
    WaitGroup& operator=(const WaitGroup&) = delete;

    void add(size_t n = 1);
    void done();
    void wait();
    size_t pending() const;

   private:
    mutable std::mutex mu_;
    std::condition_variable zero_;
    size_t pending_{0};
};
}  // namespace beagle
