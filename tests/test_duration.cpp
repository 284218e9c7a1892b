#include <cassert>

#include "../src/core/time_utils.hpp"

int main() {
    long ms = 0;
    assert(beagle::parse_duration_ms("3s", ms) && ms == 3000);
    assert(beagle::parse_duration_ms("250ms", ms) && ms == 250);
    assert(beagle::parse_duration_ms("1m", ms) && ms == 60000);
    assert(beagle::parse_duration_ms("1.5s", ms) && ms == 1500);
    assert(beagle::parse_duration_ms(".5s", ms) && ms == 500);
    assert(beagle::parse_duration_ms("2", ms) && ms == 2000);

    // compound and coarse/fine units
    assert(beagle::parse_duration_ms("1m30s", ms) && ms == 90000);
    assert(beagle::parse_duration_ms("1h", ms) && ms == 3600000);
    assert(beagle::parse_duration_ms("1h2m3s4ms", ms) && ms == 3723004);
    // sub-millisecond values round up
    assert(beagle::parse_duration_ms("500us", ms) && ms == 1);
    assert(beagle::parse_duration_ms("1500000ns", ms) && ms == 2);

    ms = 42;
    assert(!beagle::parse_duration_ms("", ms));
    assert(!beagle::parse_duration_ms("s", ms));
    assert(!beagle::parse_duration_ms(".", ms));
    assert(!beagle::parse_duration_ms("3d", ms));
    assert(!beagle::parse_duration_ms("1.2.3s", ms));
    assert(!beagle::parse_duration_ms("1m30", ms));
    assert(!beagle::parse_duration_ms("-1s", ms));
    assert(!beagle::parse_duration_ms("1e3s", ms));
    assert(!beagle::parse_duration_ms("99999999999999999999999999h", ms));
    // failures leave the output alone
    assert(ms == 42);
    return 0;
}
