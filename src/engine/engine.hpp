#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include "../core/message_sink.hpp"
#include "../probes/http_probe.hpp"
#include "../probes/http_transport.hpp"
#include "../probes/probe_target.hpp"

namespace beagle {
struct EngineOptions {
    std::string user_agent;
    bool debug{false};    // report transport errors
    bool verbose{false};  // report "not found" results
};

struct RunStats {
    size_t dispatched{0};
    size_t found{0};
    size_t not_found{0};
    size_t errored{0};
    size_t reported{0};  // lines delivered to the sink
    size_t permits_acquired{0};
    size_t permits_released{0};
    size_t peak_in_flight{0};
    size_t permits_held_at_completion{0};  // sampled when the barrier opens
    size_t workers{0};
    double elapsed_ms{0};
};

// Result line for an outcome, or "" when the outcome is not reported.
std::string format_outcome(const ProbeOutcome& outcome, bool debug, bool verbose);

// Fans probes out over a fixed pool of at most concurrency_limit worker
// threads and fans the result lines back in through a single collector thread.
class Engine {
   public:
    Engine(EngineOptions opts, HttpTransport& transport);

    // Blocks until every target has been probed and every worker has exited;
    // by then every reported line has reached sink. Returns false, without
    // probing anything, when the limit is below 1 or targets is empty.
    bool run(const std::vector<ProbeTarget>& targets, int concurrency_limit, MessageSink& sink,
             RunStats& stats, std::string& err);

   private:
    EngineOptions opts_;
    HttpTransport& transport_;
};
}  // namespace beagle
