#pragma once

#include <span>

#include "dasigner/common/bytes.hpp"

namespace dasigner {

// Ethereum-flavoured Keccak-256: original Keccak padding (0x01), not FIPS-202
// SHA3-256.
Bytes32 Keccak256(std::span<const uint8_t> data);

}  // namespace dasigner
