#pragma once
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <exception>
#include <limits>
#include <ctime>
#include <string>

namespace beagle {
inline uint64_t monotonic_ns() {
    using namespace std::chrono;
    return duration_cast<nanoseconds>(steady_clock::now().time_since_epoch()).count();
}

inline std::string wall_time_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%FT%TZ", &tm);
    return std::string(buf);
}

// Go-style durations: one or more <number><unit> segments with units ns, us,
// ms, s, m and h ("1m30s", "250ms", "1.5s"), or a bare number of seconds.
// Sub-millisecond remainders round up.
inline bool parse_duration_ms(const std::string& text, long& out_ms) {
    struct Unit {
        const char* name;
        double ms;
    };
    // longer names first so "ms" is not read as "m"
    static const Unit kUnits[] = {{"ns", 1e-6}, {"us", 1e-3}, {"ms", 1.0},
                                  {"s", 1e3},   {"m", 6e4},   {"h", 3.6e6}};
    double total = 0;
    size_t i = 0;
    while (i < text.size()) {
        size_t start = i;
        while (i < text.size() &&
               (std::isdigit(static_cast<unsigned char>(text[i])) || text[i] == '.'))
            ++i;
        if (i == start) return false;
        std::string number = text.substr(start, i - start);
        double value = 0;
        size_t used = 0;
        try {
            value = std::stod(number, &used);
        } catch (const std::exception&) {
            return false;
        }
        if (used != number.size()) return false;

        double scale = 0;
        if (i == text.size() && start == 0) {
            scale = 1e3;
        } else {
            for (const auto& u : kUnits) {
                size_t len = std::char_traits<char>::length(u.name);
                if (text.compare(i, len, u.name) == 0) {
                    scale = u.ms;
                    i += len;
                    break;
                }
            }
            if (scale == 0) return false;
        }
        total += value * scale;
    }
    if (text.empty()) return false;
    double rounded = std::ceil(total);
    if (!(rounded < static_cast<double>(std::numeric_limits<long>::max()))) return false;
    out_ms = static_cast<long>(rounded);
    return true;
}
}  // namespace beagle
