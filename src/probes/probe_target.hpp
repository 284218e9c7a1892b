#pragma once
#include <string>

namespace beagle {
// One service to check a username against. URLs are already substituted.
struct ProbeTarget {
    std::string display_name;
    std::string report_url;
    std::string check_url;
};
}  // namespace beagle
