#pragma once

#include <chrono>
#include <ctime>
#include <functional>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace cs::util {

inline std::time_t parsePostgresTimestamp(const std::string& timestampStr) {
    std::tm tm = {};
    std::istringstream ss(timestampStr.substr(0, 19)); // truncate to "YYYY-MM-DD HH:MM:SS"
    ss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
    if (ss.fail()) throw std::runtime_error("Failed to parse timestamp: " + timestampStr);
    return timegm(&tm); // returns UTC-based time_t
}

inline std::string timestampToString(const std::time_t ts) {
    std::ostringstream oss;
    oss << std::put_time(std::gmtime(&ts), "%Y-%m-%dT%H:%M:%SZ"); // ISO 8601 UTC
    return oss.str();
}

inline std::time_t parseTimestampFromString(const std::string& iso) {
    std::tm tm = {};
    std::istringstream ss(iso);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    if (ss.fail()) throw std::runtime_error("Failed to parse timestamp: " + iso);
    return timegm(&tm);
}

// SigV4 x-amz-date, YYYYMMDDTHHMMSSZ
inline std::string amzTimestamp(const std::time_t ts) {
    std::tm tm{};
    gmtime_r(&ts, &tm);
    char buffer[17];
    strftime(buffer, sizeof(buffer), "%Y%m%dT%H%M%SZ", &tm);
    return {buffer};
}

// SigV4 credential scope date, YYYYMMDD
inline std::string amzDate(const std::time_t ts) {
    std::tm tm{};
    gmtime_r(&ts, &tm);
    char buffer[9];
    strftime(buffer, sizeof(buffer), "%Y%m%d", &tm);
    return {buffer};
}

// Injected wherever expiry is decided, so tests can move time
using Clock = std::function<std::time_t()>;

inline std::time_t systemNow() {
    return std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
}

} // namespace cs::util
