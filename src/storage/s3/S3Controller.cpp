#include "storage/s3/S3Controller.hpp"
#include "util/curlWrappers.hpp"
#include "util/s3Helpers.hpp"
#include "util/timestamp.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/format.h>
#include <ctime>
#include <map>
#include <stdexcept>

using namespace cs::storage;
using namespace cs::util;
using namespace cs::logging;

S3Controller::S3Controller(config::StorageConfig cfg) : cfg_(std::move(cfg)) {
    if (cfg_.bucket.empty()) throw std::runtime_error("S3Controller requires a bucket");
    if (cfg_.access_key.empty() || cfg_.secret_access_key.empty())
        throw std::runtime_error("S3Controller requires access_key and secret_access_key");
    while (!cfg_.endpoint.empty() && cfg_.endpoint.back() == '/') cfg_.endpoint.pop_back();
    ensureCurlGlobalInit();
}

S3Controller::~S3Controller() = default;

std::pair<std::string, std::string> S3Controller::constructPaths(CURL* curl, const std::string& key) const {
    const auto escapedKey = escapeKeyPreserveSlashes(curl, key);
    const auto canonicalPath = "/" + cfg_.bucket + "/" + escapedKey;
    const auto url = cfg_.endpoint + canonicalPath;
    return {canonicalPath, url};
}

std::string S3Controller::presign(const std::string& method, const std::string& key, const std::chrono::seconds ttl) const {
    CurlEasy tmpHandle;
    const auto [canonical, url] = constructPaths(tmpHandle, key);
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    return url + "?" + buildPresignedQuery(cfg_, method, canonical, ttl, now);
}

std::string S3Controller::presignPut(const std::string& key, const std::chrono::seconds ttl) const {
    return presign("PUT", key, ttl);
}

std::string S3Controller::presignGet(const std::string& key, const std::chrono::seconds ttl) const {
    return presign("GET", key, ttl);
}

void S3Controller::deleteObject(const std::string& key) const {
    CurlEasy tmpHandle;
    const auto [canonical, url] = constructPaths(tmpHandle, key);

    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    const std::string payloadHash = sha256Hex("");
    const std::map<std::string, std::string> hdrMap{
        {"host", endpointHost(cfg_.endpoint)},
        {"x-amz-content-sha256", payloadHash},
        {"x-amz-date", amzTimestamp(now)}
    };

    SList hdrs;
    hdrs.add("Authorization: " + buildAuthorizationHeader(cfg_, "DELETE", canonical, hdrMap, payloadHash, now));
    for (const auto& [k, v] : hdrMap) hdrs.add(k + ": " + v);

    const HttpResponse resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, "DELETE");
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
    });

    if (resp.ok() || resp.http == 404) return;

    LogRegistry::cloud()->error("[S3Controller] deleteObject failed for {}: CURL={} HTTP={} Response:\n{}",
                                key, resp.curlError(), resp.http, resp.body);

    throw std::runtime_error(fmt::format("Failed to delete object from S3 (HTTP {}): {}", resp.http, resp.body));
}
