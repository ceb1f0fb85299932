#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace dasigner {

using Bytes = std::vector<uint8_t>;
using Bytes32 = std::array<uint8_t, 32>;

std::string ToHex(const uint8_t* data, size_t size);

template <typename Container>
std::string ToHex(const Container& bytes) {
  return ToHex(bytes.data(), bytes.size());
}

// Accepts an optional "0x" prefix. Throws std::invalid_argument on odd length
// or non-hex characters.
Bytes FromHex(std::string_view hex);

}  // namespace dasigner
