#pragma once
#include <algorithm>
#include <mutex>
#include <string>
#include <vector>

#include "../src/core/message_sink.hpp"

namespace beagle {
namespace test {
class CaptureSink : public MessageSink {
   public:
    void on_message(const std::string& line) override {
        std::lock_guard<std::mutex> lock(mu_);
        lines_.push_back(line);
    }
    std::vector<std::string> sorted() const {
        std::lock_guard<std::mutex> lock(mu_);
        auto copy = lines_;
        std::sort(copy.begin(), copy.end());
        return copy;
    }
    size_t size() const {
        std::lock_guard<std::mutex> lock(mu_);
        return lines_.size();
    }

   private:
    mutable std::mutex mu_;
    std::vector<std::string> lines_;
};
}  // namespace test
}  // namespace beagle
