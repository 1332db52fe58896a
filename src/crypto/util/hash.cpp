#include "crypto/util/hash.hpp"
#include "crypto/util/uuid.hpp"

#include <sodium.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace cs::crypto::hash {

namespace {
std::string toHex(const unsigned char* bytes, const size_t len) {
    std::ostringstream result;
    for (size_t i = 0; i < len; ++i)
        result << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(bytes[i]);
    return result.str();
}
}

std::string blake2b(const std::string_view bytes) {
    util::ensure_sodium_init();

    constexpr size_t hash_len = crypto_generichash_BYTES;
    unsigned char hash[hash_len];

    if (crypto_generichash(hash, hash_len,
                           reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size(),
                           nullptr, 0) != 0)
        throw std::runtime_error("blake2b hashing failed");

    return toHex(hash, hash_len);
}

}
