#include <initializer_list>
#include <string>

#include "../src/engine/engine.hpp"
#include "../src/probes/http_probe.hpp"
#include "mock_transport.hpp"

using beagle::ProbeOutcome;
using beagle::ProbeTarget;

int main() {
    beagle::test::MockTransport mock;
    ProbeTarget t{"Site", "https://site/ann", "https://api.site/ann"};

    mock.set_status(t.check_url, 200);
    ProbeOutcome o = beagle::probe(t, mock, "agent/1.0");
    if (o.kind != ProbeOutcome::Kind::Found) return 1;
    if (o.report_url != t.report_url || o.display_name != "Site") return 2;
    if (mock.last_user_agent() != "agent/1.0") return 3;

    // any status other than 200 counts as not found, including other 2xx/3xx
    for (long status : {201L, 204L, 301L, 403L, 404L, 500L}) {
        mock.set_status(t.check_url, status);
        o = beagle::probe(t, mock, "a");
        if (o.kind != ProbeOutcome::Kind::NotFound) return 4;
        if (o.status != status) return 5;
    }

    mock.set_error(t.check_url, "Connection refused");
    o = beagle::probe(t, mock, "a");
    if (o.kind != ProbeOutcome::Kind::Errored) return 6;
    if (o.message != "Connection refused") return 7;

    // message policy
    ProbeOutcome found = ProbeOutcome::found(t, 200);
    ProbeOutcome missing = ProbeOutcome::not_found(t, 404);
    ProbeOutcome failed = ProbeOutcome::errored("timeout");
    if (beagle::format_outcome(found, false, false) != "[+] https://site/ann") return 10;
    if (beagle::format_outcome(missing, false, true) != "[-] https://site/ann NOT FOUND") return 11;
    if (!beagle::format_outcome(missing, true, false).empty()) return 12;
    if (beagle::format_outcome(failed, true, false) != "timeout") return 13;
    if (!beagle::format_outcome(failed, false, true).empty()) return 14;
    return 0;
}
