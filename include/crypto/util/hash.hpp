#pragma once

#include <string>
#include <string_view>

namespace cs::crypto::hash {

// Hex BLAKE2b-256 of a byte buffer. Stable across runs and platforms.
std::string blake2b(std::string_view bytes);

}
