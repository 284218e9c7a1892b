#pragma once
#include <string>

#include "logger.hpp"

namespace beagle {
// Receives finished result lines from the collector thread only.
class MessageSink {
   public:
    virtual ~MessageSink() = default;
    virtual void on_message(const std::string& line) = 0;
};

// Result lines are the program's output: written regardless of the
// diagnostics threshold.
class LogSink : public MessageSink {
   public:
    explicit LogSink(LogLevel lvl = LogLevel::INFO) : level_(lvl) {}
    void on_message(const std::string& line) override {
        write_log_line(level_, line);
    }

   private:
    LogLevel level_;
};
}  // namespace beagle
