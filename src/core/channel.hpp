#pragma once
#include <condition_variable>
#include <deque>
#include <mutex>
#include <utility>

namespace beagle {
// Unbounded multi-producer queue with an explicit close. pop() drains
// everything pushed before close() and then reports end of stream.
template <typename T>
class Channel {
   public:
    Channel() = default;
    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    // Returns false if the channel is already closed; the value is dropped.
    bool push(T value) {
        {
            std::lock_guard<std::mutex> lock(mu_);
            if (closed_) return false;
            buffer_.push_back(std::move(value));
        }
        not_empty_.notify_one();
        return true;
    }

    // Blocks while empty and open. Returns false once empty and closed.
    bool pop(T& out) {
        std::unique_lock<std::mutex> lock(mu_);
        not_empty_.wait(lock, [this] { return !buffer_.empty() || closed_; });
        if (buffer_.empty()) return false;
        out = std::move(buffer_.front());
        buffer_.pop_front();
        return true;
    }

    // Returns false on a second close.
    bool close() {
        {
            std::lock_guard<std::mutex> lock(mu_);
            if (closed_) return false;
            closed_ = true;
        }
        not_empty_.notify_all();
        return true;
    }

   private:
    std::mutex mu_;
    std::condition_variable not_empty_;
    std::deque<T> buffer_;
    bool closed_{false};
};
}  // namespace beagle
