#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "core/logger.hpp"
#include "core/message_sink.hpp"
#include "core/time_utils.hpp"
#include "engine/engine.hpp"
#include "probes/http_transport.hpp"
#include "targets/target_loader.hpp"

using namespace beagle;

namespace {
struct CliConfig {
    std::string agent =
        "Mozilla/5.0 (X11; Ubuntu; Linux x86_64; rv:67.0) Gecko/20100101 Firefox/67.0";
    bool debug = false;
    std::string file = "./urls.csv";
    int workers = 1;
    std::string proxy;
    long timeout_ms = 3000;
    std::string user = "me";
    bool verbose = false;
    LogLevel log_level = LogLevel::INFO;
};

void print_usage() {
    std::cerr << "Usage: beagle [options]\n"
              << "Search for a specific username across the Internet.\n\n"
              << "  -a, --agent <ua>          user agent\n"
              << "      --debug               prints error messages\n"
              << "  -f, --file <path>         .csv file with the URLs to check (default ./urls.csv)\n"
              << "  -g, --goroutines <n>      number of concurrent requests (default 1)\n"
              << "  -w, --workers <n>         alias of --goroutines\n"
              << "  -p, --proxy <url>         proxy URL\n"
              << "  -t, --timeout <dur>       max time to wait for a response (default 3s)\n"
              << "  -u, --user <name>         username you want to search for (default me)\n"
              << "  -v, --verbose             prints all the results\n"
              << "  -l, --log-level <level>   diagnostics: debug, info, warn, error (default info)\n"
              << "  -h, --help                show this help\n\n"
              << "Example: beagle -g 10 -t 1s -u me -v\n";
}

void disclaimer() {
    std::cout << "\t    __\n"
              << " \\,--------/_/'--o  \tUse beagle with\n"
              << " /_    ___    /~\"   \tresponsibility.\n"
              << "  /_/_/  /_/_/\n"
              << "^^^^^^^^^^^^^^^^^^\n\n";
    std::cout.flush();
}

// Returns 0 to continue, 1 after --help, 2 on a usage error.
int parse_args(int argc, char** argv, CliConfig& cfg) {
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        std::string value;
        bool has_inline = false;
        auto eq = a.find('=');
        if (a.rfind("--", 0) == 0 && eq != std::string::npos) {
            value = a.substr(eq + 1);
            a = a.substr(0, eq);
            has_inline = true;
        }
        auto take = [&](std::string& out) {
            if (has_inline) {
                out = value;
                return true;
            }
            if (i + 1 >= argc) return false;
            out = argv[++i];
            return true;
        };

        if (a == "-h" || a == "--help") {
            print_usage();
            return 1;
        } else if (a == "--debug") {
            cfg.debug = true;
        } else if (a == "-v" || a == "--verbose") {
            cfg.verbose = true;
        } else if (a == "-a" || a == "--agent") {
            if (!take(cfg.agent)) return 2;
        } else if (a == "-f" || a == "--file") {
            if (!take(cfg.file)) return 2;
        } else if (a == "-p" || a == "--proxy") {
            if (!take(cfg.proxy)) return 2;
        } else if (a == "-u" || a == "--user") {
            if (!take(cfg.user)) return 2;
        } else if (a == "-g" || a == "--goroutines" || a == "-w" || a == "--workers") {
            std::string n;
            if (!take(n)) return 2;
            try {
                size_t used = 0;
                cfg.workers = std::stoi(n, &used);
                if (used != n.size()) return 2;
            } catch (const std::exception&) {
                std::cerr << "invalid value \"" << n << "\" for " << a << "\n";
                return 2;
            }
        } else if (a == "-l" || a == "--log-level") {
            std::string lvl;
            if (!take(lvl)) return 2;
            if (!parse_log_level(lvl, cfg.log_level)) {
                std::cerr << "invalid log level \"" << lvl << "\" for " << a << "\n";
                return 2;
            }
        } else if (a == "-t" || a == "--timeout") {
            std::string d;
            if (!take(d)) return 2;
            if (!parse_duration_ms(d, cfg.timeout_ms)) {
                std::cerr << "invalid duration \"" << d << "\" for " << a << "\n";
                return 2;
            }
        } else {
            std::cerr << "unknown flag: " << a << "\n";
            return 2;
        }
    }
    return 0;
}
}  // namespace

int main(int argc, char** argv) {
    CliConfig cfg;
    int rc = parse_args(argc, argv, cfg);
    if (rc == 1) return 0;
    if (rc == 2) {
        print_usage();
        return 2;
    }
    set_log_level(cfg.log_level);

    std::vector<ProbeTarget> targets;
    std::string err;
    if (!load_targets(cfg.file, cfg.user, targets, err)) {
        log(LogLevel::ERROR, err);
        return 1;
    }

    HttpConfig http;
    http.timeout_ms = cfg.timeout_ms;
    http.proxy = cfg.proxy;
    std::unique_ptr<HttpTransport> transport = make_curl_transport(http, err);
    if (!transport) {
        log(LogLevel::ERROR, "while creating the http client: " + err);
        return 1;
    }

    EngineOptions opts;
    opts.user_agent = cfg.agent;
    opts.debug = cfg.debug;
    opts.verbose = cfg.verbose;
    Engine engine(opts, *transport);
    LogSink sink;
    RunStats stats;

    disclaimer();
    if (!engine.run(targets, cfg.workers, sink, stats, err)) {
        log(LogLevel::ERROR, err);
        return 1;
    }
    return 0;
}
