#include "http_probe.hpp"

namespace beagle {
namespace {
constexpr long kStatusOk = 200;
}

ProbeOutcome probe(const ProbeTarget& target, HttpTransport& transport,
                   const std::string& user_agent) {
    TransportResult r = transport.get(target.check_url, user_agent);
    if (!r.ok) return ProbeOutcome::errored(r.error);
    if (r.status != kStatusOk) return ProbeOutcome::not_found(target, r.status);
    return ProbeOutcome::found(target, r.status);
}
}  // namespace beagle
