#include <string>

#include "../src/probes/http_transport.hpp"

int main() {
    beagle::HttpConfig cfg;
    std::string err;
    if (!beagle::validate_http_config(cfg, err)) return 1;

    cfg.proxy = "socks5://127.0.0.1:9050";
    if (!beagle::validate_http_config(cfg, err)) return 2;
    cfg.proxy = "http://user:pw@proxy.local:3128";
    if (!beagle::validate_http_config(cfg, err)) return 3;

    cfg.proxy = "ftp://proxy.local:21";
    if (beagle::validate_http_config(cfg, err)) return 4;
    if (err.find("ftp") == std::string::npos) return 5;

    cfg.proxy = "http://[::1";
    if (beagle::validate_http_config(cfg, err)) return 6;

    cfg.proxy.clear();
    cfg.timeout_ms = 0;
    if (beagle::validate_http_config(cfg, err)) return 7;

    // construction fails the same way, without touching the network
    cfg.timeout_ms = 1000;
    cfg.proxy = "gopher://nope";
    err.clear();
    if (beagle::make_curl_transport(cfg, err) != nullptr) return 8;
    if (err.empty()) return 9;

    cfg.proxy.clear();
    if (beagle::make_curl_transport(cfg, err) == nullptr) return 10;
    return 0;
}
