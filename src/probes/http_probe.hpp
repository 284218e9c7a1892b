#pragma once
#include <string>

#include "http_transport.hpp"
#include "probe_target.hpp"

namespace beagle {
struct ProbeOutcome {
    enum class Kind { Found, NotFound, Errored };

    Kind kind{Kind::Errored};
    std::string display_name;
    std::string report_url;
    std::string message;  // Errored only
    long status{0};

    static ProbeOutcome found(const ProbeTarget& t, long status) {
        return {Kind::Found, t.display_name, t.report_url, "", status};
    }
    static ProbeOutcome not_found(const ProbeTarget& t, long status) {
        return {Kind::NotFound, t.display_name, t.report_url, "", status};
    }
    static ProbeOutcome errored(const std::string& message) {
        return {Kind::Errored, "", "", message, 0};
    }
};

// Issues one GET to target.check_url. Only status 200 counts as found;
// transport failures come back as Errored and are never fatal.
ProbeOutcome probe(const ProbeTarget& target, HttpTransport& transport,
                   const std::string& user_agent);
}  // namespace beagle
