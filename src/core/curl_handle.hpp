#pragma once
#include <curl/curl.h>

namespace beagle {
// Owns one libcurl easy handle.
class CurlHandle {
   public:
    CurlHandle() : h_(curl_easy_init()) {}
    ~CurlHandle() {
        reset();
    }
    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
    CurlHandle(CurlHandle&& o) noexcept : h_(o.h_) {
        o.h_ = nullptr;
    }
    CurlHandle& operator=(CurlHandle&& o) noexcept {
        if (this != &o) {
            reset();
            h_ = o.h_;
            o.h_ = nullptr;
        }
        return *this;
    }
    CURL* get() const {
        return h_;
    }
    void reset() {
        if (h_) curl_easy_cleanup(h_);
        h_ = nullptr;
    }
    explicit operator bool() const {
        return h_ != nullptr;
    }

   private:
    CURL* h_;
};

// Owns a parsed URL from the libcurl URL API.
class CurlUrl {
   public:
    CurlUrl() : u_(curl_url()) {}
    ~CurlUrl() {
        if (u_) curl_url_cleanup(u_);
    }
    CurlUrl(const CurlUrl&) = delete;
    CurlUrl& operator=(const CurlUrl&) = delete;
    CURLU* get() const {
        return u_;
    }

   private:
    CURLU* u_;
};
}  // namespace beagle
