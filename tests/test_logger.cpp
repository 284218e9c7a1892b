#include <cassert>

#include "../src/core/logger.hpp"

int main() {
    using beagle::LogLevel;
    LogLevel lvl = LogLevel::INFO;
    assert(beagle::parse_log_level("debug", lvl) && lvl == LogLevel::DEBUG);
    assert(beagle::parse_log_level("error", lvl) && lvl == LogLevel::ERROR);
    assert(!beagle::parse_log_level("DEBUG", lvl) && lvl == LogLevel::ERROR);
    assert(!beagle::parse_log_level("", lvl));

    // diagnostics are off below the threshold; the default hides DEBUG
    assert(!beagle::log_enabled(LogLevel::DEBUG));
    assert(beagle::log_enabled(LogLevel::INFO));
    beagle::set_log_level(LogLevel::WARN);
    assert(!beagle::log_enabled(LogLevel::INFO));
    assert(beagle::log_enabled(LogLevel::ERROR));
    beagle::set_log_level(LogLevel::DEBUG);
    assert(beagle::log_enabled(LogLevel::DEBUG));
    return 0;
}
