#include "permit_pool.hpp"

#include <algorithm>
#include <stdexcept>

namespace beagle {
PermitPool::PermitPool(size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) throw std::invalid_argument("permit pool capacity must be at least 1");
}

void PermitPool::acquire() {
    std::unique_lock<std::mutex> lock(mu_);
    not_full_.wait(lock, [this] { return in_use_ < capacity_; });
    ++in_use_;
    ++acquired_;
    peak_ = std::max(peak_, in_use_);
}

void PermitPool::release() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (in_use_ == 0) throw std::logic_error("permit released without being acquired");
        --in_use_;
        ++released_;
    }
    not_full_.notify_one();
}

size_t PermitPool::in_use() const {
    std::lock_guard<std::mutex> lock(mu_);
    return in_use_;
}

size_t PermitPool::peak_in_use() const {
    std::lock_guard<std::mutex> lock(mu_);
    return peak_;
}

size_t PermitPool::acquired_total() const {
    std::lock_guard<std::mutex> lock(mu_);
    return acquired_;
}

size_t PermitPool::released_total() const {
    std::lock_guard<std::mutex> lock(mu_);
    return released_;
}
}  // namespace beagle
