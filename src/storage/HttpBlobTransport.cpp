#include "storage/BlobTransport.hpp"
#include "util/curlWrappers.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/format.h>
#include <algorithm>
#include <cstring>
#include <stdexcept>

using namespace cs::storage;
using namespace cs::util;
using namespace cs::logging;

namespace {
struct ReadCursor {
    const std::string* data;
    size_t offset = 0;
};

size_t readFromString(char* buffer, const size_t size, const size_t nitems, void* userdata) {
    auto* cur = static_cast<ReadCursor*>(userdata);
    const size_t n = std::min(size * nitems, cur->data->size() - cur->offset);
    std::memcpy(buffer, cur->data->data() + cur->offset, n);
    cur->offset += n;
    return n;
}
}

HttpBlobTransport::HttpBlobTransport(const std::chrono::seconds timeout) : timeout_(timeout) {
    ensureCurlGlobalInit();
}

void HttpBlobTransport::put(const std::string& capabilityUrl, const std::string& bytes) {
    ReadCursor cursor{&bytes};
    SList hdrs;
    hdrs.add("Content-Type: application/octet-stream");

    const auto resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, capabilityUrl.c_str());
        curl_easy_setopt(h, CURLOPT_UPLOAD, 1L);
        curl_easy_setopt(h, CURLOPT_READFUNCTION, readFromString);
        curl_easy_setopt(h, CURLOPT_READDATA, &cursor);
        curl_easy_setopt(h, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(bytes.size()));
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(timeout_.count()));
    });

    if (!resp.ok()) {
        LogRegistry::cloud()->warn("[HttpBlobTransport] PUT failed: CURL={} HTTP={}", resp.curlError(), resp.http);
        throw std::runtime_error(fmt::format("upload rejected (HTTP {}, {})", resp.http, resp.curlError()));
    }
}

std::string HttpBlobTransport::get(const std::string& capabilityUrl) {
    const auto resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, capabilityUrl.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(timeout_.count()));
    });

    if (!resp.ok()) {
        LogRegistry::cloud()->warn("[HttpBlobTransport] GET failed: CURL={} HTTP={}", resp.curlError(), resp.http);
        throw std::runtime_error(fmt::format("download failed (HTTP {}, {})", resp.http, resp.curlError()));
    }
    return resp.body;
}
