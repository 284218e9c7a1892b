#pragma once
#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace beagle {
// Counting semaphore bounding in-flight probes.
class PermitPool {
   public:
    explicit PermitPool(size_t capacity);
    PermitPool(const PermitPool&) = delete;
    PermitPool& operator=(const PermitPool&) = delete;

    // Blocks while all permits are held.
    void acquire();
    // Throws std::logic_error when nothing is held.
    void release();

    size_t capacity() const {
        return capacity_;
    }
    size_t in_use() const;
    size_t peak_in_use() const;
    size_t acquired_total() const;
    size_t released_total() const;

   private:
    const size_t capacity_;
    mutable std::mutex mu_;
    std::condition_variable not_full_;
    size_t in_use_{0};
    size_t peak_{0};
    size_t acquired_{0};
    size_t released_{0};
};
}  // namespace beagle
