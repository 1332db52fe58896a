#pragma once

#include <sodium.h>
#include <array>
#include <cstdint>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <string_view>

namespace cs::crypto::util {

// thread-safe, idempotent
inline void ensure_sodium_init() {
    static const int init = []{
        if (sodium_init() < 0) throw std::runtime_error("libsodium init failed");
        return 1;
    }();
    (void)init;
}

// RFC 4122 v4 UUID (hex string)
inline std::string uuid4_hex() {
    ensure_sodium_init();
    std::array<uint8_t,16> b{};
    randombytes_buf(b.data(), b.size());
    b[6] = (b[6] & 0x0F) | 0x40; // version 4
    b[8] = (b[8] & 0x3F) | 0x80; // variant

    char s[37];
    std::snprintf(s, sizeof s,
        "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
        b[0], b[1], b[2], b[3], b[4], b[5], b[6], b[7],
        b[8], b[9], b[10], b[11], b[12], b[13], b[14], b[15]);
    return {s};
}

// 8-4-4-4-12 hex, either case
inline bool is_uuid(const std::string_view s) {
    if (s.size() != 36) return false;
    for (size_t i = 0; i < s.size(); ++i) {
        const char c = s[i];
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (c != '-') return false;
        } else if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F'))) {
            return false;
        }
    }
    return true;
}

}
