#pragma once
#include <memory>
#include <string>

namespace beagle {
struct HttpConfig {
    long timeout_ms{3000};
    std::string proxy;  // empty: direct connection
};

struct TransportResult {
    bool ok{false};
    long status{0};
    std::string error;
};

// Performs one GET. Implementations must be safe to call from many threads.
class HttpTransport {
   public:
    virtual ~HttpTransport() = default;
    virtual TransportResult get(const std::string& url, const std::string& user_agent) = 0;
};

bool validate_http_config(const HttpConfig& cfg, std::string& err);

// Returns nullptr and fills err when the configuration is unusable.
std::unique_ptr<HttpTransport> make_curl_transport(const HttpConfig& cfg, std::string& err);
}  // namespace beagle
