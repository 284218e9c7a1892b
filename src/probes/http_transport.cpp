#include "http_transport.hpp"

#include <curl/curl.h>

#include <mutex>
#include <utility>

#include "../core/curl_handle.hpp"
#include "../core/logger.hpp"

namespace beagle {
namespace {
const char* const kProxySchemes[] = {"http", "https", "socks4", "socks4a", "socks5", "socks5h"};
constexpr long kMaxRedirects = 10;

size_t discard_body(char*, size_t size, size_t nmemb, void*) {
    return size * nmemb;
}

bool global_init(std::string& err) {
    static std::once_flag once;
    static CURLcode rc = CURLE_OK;
    std::call_once(once, [] { rc = curl_global_init(CURL_GLOBAL_DEFAULT); });
    if (rc != CURLE_OK) {
        err = std::string("curl_global_init: ") + curl_easy_strerror(rc);
        return false;
    }
    return true;
}

class CurlTransport : public HttpTransport {
   public:
    explicit CurlTransport(HttpConfig cfg) : cfg_(std::move(cfg)) {}

    TransportResult get(const std::string& url, const std::string& user_agent) override {
        TransportResult res;
        CurlHandle h;
        if (!h) {
            res.error = "GET " + url + ": curl_easy_init failed";
            return res;
        }
        char errbuf[CURL_ERROR_SIZE] = {};
        CURL* c = h.get();
        curl_easy_setopt(c, CURLOPT_URL, url.c_str());
        curl_easy_setopt(c, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(c, CURLOPT_USERAGENT, user_agent.c_str());
        curl_easy_setopt(c, CURLOPT_TIMEOUT_MS, cfg_.timeout_ms);
        // Signals cannot be used for timeouts from worker threads.
        curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(c, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(c, CURLOPT_MAXREDIRS, kMaxRedirects);
        curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, discard_body);
        curl_easy_setopt(c, CURLOPT_ERRORBUFFER, errbuf);
        if (!cfg_.proxy.empty()) curl_easy_setopt(c, CURLOPT_PROXY, cfg_.proxy.c_str());

        CURLcode rc = curl_easy_perform(c);
        if (rc != CURLE_OK) {
            res.error = "GET " + url + ": " + (errbuf[0] ? errbuf : curl_easy_strerror(rc));
            return res;
        }
        long status = 0;
        rc = curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &status);
        if (rc != CURLE_OK) {
            res.error = "GET " + url + ": " + curl_easy_strerror(rc);
            return res;
        }
        res.ok = true;
        res.status = status;
        return res;
    }

   private:
    const HttpConfig cfg_;
};
}  // namespace

bool validate_http_config(const HttpConfig& cfg, std::string& err) {
    if (cfg.timeout_ms <= 0) {
        err = "timeout must be greater than zero";
        return false;
    }
    if (cfg.proxy.empty()) return true;

    CurlUrl u;
    if (!u.get()) {
        err = "curl_url: out of memory";
        return false;
    }
    CURLUcode uc =
        curl_url_set(u.get(), CURLUPART_URL, cfg.proxy.c_str(), CURLU_NON_SUPPORT_SCHEME);
    if (uc != CURLUE_OK) {
        err = "invalid proxy URL \"" + cfg.proxy + "\"";
        return false;
    }
    char* scheme = nullptr;
    if (curl_url_get(u.get(), CURLUPART_SCHEME, &scheme, 0) != CURLUE_OK || !scheme) {
        err = "proxy URL \"" + cfg.proxy + "\" has no scheme";
        return false;
    }
    std::string s(scheme);
    curl_free(scheme);
    for (const char* allowed : kProxySchemes) {
        if (s == allowed) return true;
    }
    err = "unsupported proxy scheme \"" + s + "\"";
    return false;
}

std::unique_ptr<HttpTransport> make_curl_transport(const HttpConfig& cfg, std::string& err) {
    if (!global_init(err)) return nullptr;
    if (!validate_http_config(cfg, err)) return nullptr;
    log(LogLevel::DEBUG, "http client: timeout " + std::to_string(cfg.timeout_ms) + "ms, proxy " +
                             (cfg.proxy.empty() ? std::string("none") : cfg.proxy));
    return std::unique_ptr<HttpTransport>(new CurlTransport(cfg));
}
}  // namespace beagle
