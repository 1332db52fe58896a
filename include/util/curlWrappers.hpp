#pragma once

#include "util/s3Helpers.hpp"

#include <curl/curl.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace cs::util {

class CurlEasy {
public:
    CurlEasy() : h_(curl_easy_init()) {
        if (!h_) throw std::runtime_error("curl_easy_init failed");
        curl_easy_setopt(h_, CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(h_, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(h_, CURLOPT_NOSIGNAL, 1L);
    }
    ~CurlEasy() { curl_easy_cleanup(h_); }

    CurlEasy(const CurlEasy&) = delete;
    CurlEasy& operator=(const CurlEasy&) = delete;

    operator CURL*()       { return h_; }
    operator const CURL*() const { return h_; }

private:
    CURL* h_;
};

class SList {
public:
    SList() = default;
    SList(const SList&) = delete;
    SList& operator=(const SList&) = delete;
    SList(SList&& o) noexcept : store_(std::move(o.store_)), head_(o.head_) { o.head_ = nullptr; }

    void add(std::string s) {
        store_.push_back(std::move(s));
        head_ = curl_slist_append(head_, store_.back().c_str());
    }
    ~SList() { curl_slist_free_all(head_); }
    curl_slist* get() const { return head_; }

private:
    std::vector<std::string> store_;
    curl_slist*              head_ = nullptr;
};

struct HttpResponse {
    CURLcode curl  = CURLE_OK;
    long     http  = 0;
    std::string body;
    std::string hdr;
    [[nodiscard]] bool ok() const { return curl == CURLE_OK && http / 100 == 2; }
    [[nodiscard]] std::string curlError() const { return curl_easy_strerror(curl); }
};

template <class SetupFn>
static HttpResponse performCurl(SetupFn&& setup) {
    ensureCurlGlobalInit();

    CurlEasy h;
    std::string bodyBuf, hdrBuf;

    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, writeToString);
    curl_easy_setopt(h, CURLOPT_WRITEDATA,  &bodyBuf);
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, writeToString);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &hdrBuf);

    setup(h);                      // caller-specific tweaks

    HttpResponse r;
    r.curl = curl_easy_perform(h);
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &r.http);
    r.body.swap(bodyBuf);
    r.hdr.swap(hdrBuf);
    return r;
}

}
