#include "util/s3Helpers.hpp"
#include "util/timestamp.hpp"
#include "config/Config.hpp"

#include <openssl/hmac.h>
#include <openssl/sha.h>
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace cs::util {

namespace {
constexpr auto kAlgorithm = "AWS4-HMAC-SHA256";
constexpr auto kService = "s3";
constexpr auto kUnsignedPayload = "UNSIGNED-PAYLOAD";

std::string signingKey(const config::StorageConfig& creds, const std::string& dateStamp) {
    const std::string kDate    = hmacSha256Raw("AWS4" + creds.secret_access_key, dateStamp);
    const std::string kRegion  = hmacSha256Raw(kDate, creds.region);
    const std::string kService_ = hmacSha256Raw(kRegion, kService);
    return hmacSha256Raw(kService_, "aws4_request");
}

std::string credentialScope(const config::StorageConfig& creds, const std::string& dateStamp) {
    return dateStamp + "/" + creds.region + "/" + kService + "/aws4_request";
}
}

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::string sha256Hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    std::ostringstream oss;
    for (const unsigned char c : hash) oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
    return oss.str();
}

std::string hmacSha256Raw(const std::string& key, const std::string& data) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest, nullptr);
    return {reinterpret_cast<char*>(digest), SHA256_DIGEST_LENGTH};
}

std::string hmacSha256HexFromRaw(const std::string& rawKey, const std::string& data) {
    unsigned char sig[SHA256_DIGEST_LENGTH];
    HMAC(EVP_sha256(), rawKey.data(), static_cast<int>(rawKey.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(), sig, nullptr);

    std::ostringstream oss;
    for (unsigned char i : sig) oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(i);
    return oss.str();
}

std::string uriEscape(CURL* curl, const std::string_view value) {
    char* esc = curl_easy_escape(curl, value.data(), static_cast<int>(value.size()));
    if (!esc) throw std::runtime_error("curl_easy_escape failed");
    std::string out(esc);
    curl_free(esc);
    return out;
}

std::string escapeKeyPreserveSlashes(CURL* curl, const std::string& key) {
    std::ostringstream out;
    size_t start = 0;
    while (true) {
        const auto slash = key.find('/', start);
        const auto seg = std::string_view(key).substr(start, slash == std::string::npos ? std::string::npos : slash - start);
        out << uriEscape(curl, seg);
        if (slash == std::string::npos) break;
        out << '/';
        start = slash + 1;
    }
    return out.str();
}

size_t writeToString(const char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

std::string endpointHost(const std::string& endpoint) {
    auto host = endpoint;
    if (const auto pos = host.find("//"); pos != std::string::npos) host = host.substr(pos + 2);
    while (!host.empty() && host.back() == '/') host.pop_back();
    return host;
}

std::string buildAuthorizationHeader(const config::StorageConfig& creds,
                                     const std::string& method,
                                     const std::string& canonicalPath,
                                     const std::map<std::string, std::string>& headers,
                                     const std::string& payloadHash,
                                     const std::time_t now) {
    const std::string amzDate = headers.at("x-amz-date");
    const std::string dateStamp = util::amzDate(now);

    // std::map keeps the header names sorted, which SigV4 requires
    std::string canonicalHeaders, signedHeaders;
    for (auto it = headers.begin(); it != headers.end(); ++it) {
        canonicalHeaders += it->first + ":" + it->second + "\n";
        signedHeaders += it->first;
        if (std::next(it) != headers.end())
            signedHeaders += ";";
    }

    std::ostringstream canonicalRequestStream;
    canonicalRequestStream << method << "\n"
                           << canonicalPath << "\n"
                           << "" << "\n"
                           << canonicalHeaders << "\n"
                           << signedHeaders << "\n"
                           << payloadHash;

    const auto scope = credentialScope(creds, dateStamp);
    std::ostringstream stringToSignStream;
    stringToSignStream << kAlgorithm << "\n"
                       << amzDate << "\n"
                       << scope << "\n"
                       << sha256Hex(canonicalRequestStream.str());

    const std::string signature = hmacSha256HexFromRaw(signingKey(creds, dateStamp), stringToSignStream.str());

    std::ostringstream authHeader;
    authHeader << kAlgorithm << " "
               << "Credential=" << creds.access_key << "/" << scope << ", "
               << "SignedHeaders=" << signedHeaders << ", "
               << "Signature=" << signature;

    return authHeader.str();
}

std::string buildPresignedQuery(const config::StorageConfig& creds,
                                const std::string& method,
                                const std::string& canonicalPath,
                                const std::chrono::seconds ttl,
                                const std::time_t now) {
    ensureCurlGlobalInit();

    const std::string amzDate = amzTimestamp(now);
    const std::string dateStamp = util::amzDate(now);
    const auto scope = credentialScope(creds, dateStamp);

    // Parameter names are already in byte order
    std::ostringstream query;
    query << "X-Amz-Algorithm=" << kAlgorithm
          << "&X-Amz-Credential=" << uriEscape(nullptr, creds.access_key + "/" + scope)
          << "&X-Amz-Date=" << amzDate
          << "&X-Amz-Expires=" << ttl.count()
          << "&X-Amz-SignedHeaders=host";
    const std::string canonicalQuery = query.str();

    std::ostringstream canonicalRequest;
    canonicalRequest << method << "\n"
                     << canonicalPath << "\n"
                     << canonicalQuery << "\n"
                     << "host:" << endpointHost(creds.endpoint) << "\n"
                     << "\n"
                     << "host" << "\n"
                     << kUnsignedPayload;

    std::ostringstream stringToSign;
    stringToSign << kAlgorithm << "\n"
                 << amzDate << "\n"
                 << scope << "\n"
                 << sha256Hex(canonicalRequest.str());

    const auto signature = hmacSha256HexFromRaw(signingKey(creds, dateStamp), stringToSign.str());
    return canonicalQuery + "&X-Amz-Signature=" + signature;
}

}
