#pragma once

#include <chrono>
#include <ctime>
#include <map>
#include <string>
#include <string_view>
#include <curl/curl.h>

namespace cs::config { struct StorageConfig; }

namespace cs::util {

std::string sha256Hex(const std::string& data);
std::string hmacSha256Raw(const std::string& key, const std::string& data);
std::string hmacSha256HexFromRaw(const std::string& rawKey, const std::string& data);

// RFC 3986 escaping of each key segment, '/' kept as separator
std::string escapeKeyPreserveSlashes(CURL* curl, const std::string& key);
std::string uriEscape(CURL* curl, std::string_view value);

size_t writeToString(const char* ptr, size_t size, size_t nmemb, void* userdata);

// Host part of an endpoint URL, scheme and trailing slash stripped
std::string endpointHost(const std::string& endpoint);

std::string buildAuthorizationHeader(const config::StorageConfig& creds,
                                     const std::string& method, const std::string& canonicalPath,
                                     const std::map<std::string, std::string>& headers,
                                     const std::string& payloadHash, std::time_t now);

// Query string (without '?') carrying a SigV4 query signature for `method` on `canonicalPath`
std::string buildPresignedQuery(const config::StorageConfig& creds,
                                const std::string& method, const std::string& canonicalPath,
                                std::chrono::seconds ttl, std::time_t now);

void ensureCurlGlobalInit();

}
