#include "engine.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <system_error>
#include <thread>
#include <utility>

#include "../core/channel.hpp"
#include "../core/logger.hpp"
#include "../core/permit_pool.hpp"
#include "../core/time_utils.hpp"
#include "../core/wait_group.hpp"

namespace beagle {
namespace {
struct Counters {
    std::atomic<size_t> found{0};
    std::atomic<size_t> not_found{0};
    std::atomic<size_t> errored{0};
};

// Releases the job's permit, then marks it done, on every exit path.
class WorkerExit {
   public:
    WorkerExit(PermitPool& pool, WaitGroup& wg) : pool_(pool), wg_(wg) {}
    ~WorkerExit() {
        pool_.release();
        wg_.done();
    }
    WorkerExit(const WorkerExit&) = delete;
    WorkerExit& operator=(const WorkerExit&) = delete;

   private:
    PermitPool& pool_;
    WaitGroup& wg_;
};

void count(Counters& c, const ProbeOutcome& o) {
    switch (o.kind) {
        case ProbeOutcome::Kind::Found: ++c.found; break;
        case ProbeOutcome::Kind::NotFound: ++c.not_found; break;
        case ProbeOutcome::Kind::Errored: ++c.errored; break;
    }
}

void emit(Channel<std::string>& results, std::string line) {
    if (line.empty()) return;
    if (!results.push(std::move(line))) log(LogLevel::ERROR, "result dropped: channel closed");
}
}  // namespace

std::string format_outcome(const ProbeOutcome& outcome, bool debug, bool verbose) {
    switch (outcome.kind) {
        case ProbeOutcome::Kind::Errored:
            return debug ? outcome.message : std::string();
        case ProbeOutcome::Kind::NotFound:
            return verbose ? "[-] " + outcome.report_url + " NOT FOUND" : std::string();
        case ProbeOutcome::Kind::Found:
            return "[+] " + outcome.report_url;
    }
    return std::string();
}

Engine::Engine(EngineOptions opts, HttpTransport& transport)
    : opts_(std::move(opts)), transport_(transport) {}

bool Engine::run(const std::vector<ProbeTarget>& targets, int concurrency_limit,
                 MessageSink& sink, RunStats& stats, std::string& err) {
    if (concurrency_limit < 1) {
        err = "invalid concurrency limit " + std::to_string(concurrency_limit) +
              ": must be at least 1";
        return false;
    }
    if (targets.empty()) {
        err = "no targets to probe";
        return false;
    }

    uint64_t start_ns = monotonic_ns();
    PermitPool permits(static_cast<size_t>(concurrency_limit));
    WaitGroup pending;
    Channel<const ProbeTarget*> jobs;
    Channel<std::string> results;
    Counters counters;
    std::atomic<size_t> reported{0};

    std::thread collector([&results, &sink, &reported] {
        std::string line;
        while (results.pop(line)) {
            sink.on_message(line);
            ++reported;
        }
    });

    auto worker_loop = [this, &jobs, &permits, &pending, &results, &counters] {
        const ProbeTarget* target = nullptr;
        while (jobs.pop(target)) {
            WorkerExit exit(permits, pending);
            ProbeOutcome outcome;
            try {
                outcome = probe(*target, transport_, opts_.user_agent);
            } catch (const std::exception& e) {
                outcome = ProbeOutcome::errored("GET " + target->check_url + ": " + e.what());
            }
            count(counters, outcome);
            emit(results, format_outcome(outcome, opts_.debug, opts_.verbose));
        }
    };

    // More workers than targets would only idle.
    size_t want = std::min(static_cast<size_t>(concurrency_limit), targets.size());
    std::vector<std::thread> workers;
    workers.reserve(want);
    for (size_t i = 0; i < want; ++i) {
        try {
            workers.emplace_back(worker_loop);
        } catch (const std::system_error& e) {
            log(LogLevel::WARN, "cannot start worker " + std::to_string(i + 1) + ": " + e.what());
            break;
        }
    }
    if (workers.empty()) {
        results.close();
        collector.join();
        err = "cannot start any worker thread";
        return false;
    }

    for (const auto& target : targets) {
        pending.add();
        permits.acquire();
        log(LogLevel::DEBUG, "dispatch " + target.display_name + " (" +
                                 std::to_string(permits.in_use()) + "/" +
                                 std::to_string(permits.capacity()) + " in flight)");
        if (!jobs.push(&target)) {
            log(LogLevel::ERROR, "job queue closed before " + target.display_name);
            ++counters.errored;
            permits.release();
            pending.done();
        }
    }

    pending.wait();
    stats.permits_held_at_completion = permits.in_use();
    jobs.close();
    for (auto& w : workers) w.join();
    results.close();
    collector.join();

    stats.dispatched = targets.size();
    stats.found = counters.found.load();
    stats.not_found = counters.not_found.load();
    stats.errored = counters.errored.load();
    stats.reported = reported.load();
    stats.permits_acquired = permits.acquired_total();
    stats.permits_released = permits.released_total();
    stats.peak_in_flight = permits.peak_in_use();
    stats.workers = workers.size();
    stats.elapsed_ms = (monotonic_ns() - start_ns) / 1e6;
    log(LogLevel::DEBUG, "run finished in " +
                             std::to_string(static_cast<long>(stats.elapsed_ms)) + "ms: " +
                             std::to_string(stats.dispatched) + " probed, " +
                             std::to_string(stats.found) + " found, " +
                             std::to_string(stats.not_found) + " not found, " +
                             std::to_string(stats.errored) + " errors, " +
                             std::to_string(stats.workers) + " workers, peak " +
                             std::to_string(stats.peak_in_flight) + " in flight");
    return true;
}
}  // namespace beagle
