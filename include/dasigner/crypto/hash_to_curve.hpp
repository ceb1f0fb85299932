#pragma once

#include <cstddef>
#include <cstdint>

#include "dasigner/common/bytes.hpp"
#include "dasigner/crypto/encoding.hpp"
#include "dasigner/crypto/g1_point.hpp"

namespace dasigner {

constexpr size_t kBlobVerifiedPreimageLen = 5 * 32;

// root || epoch || quorum_id || cx || cy, every field 32 bytes big-endian with
// no length prefixes (Solidity abi.encodePacked of bytes32/uint256 values).
// The on-chain verifier rebuilds exactly these bytes.
Bytes BlobVerifiedPreimage(const StorageRoot& storage_root,
                           uint64_t epoch,
                           uint64_t quorum_id,
                           const G1Point& erasure_commitment);

// Try-and-increment: x = digest mod q, then the first x' >= x with
// x'^3 + 3 a square, y = (x'^3 + 3)^((q + 1) / 4).
G1Point MapToG1(const Bytes32& digest);

// Keccak-256 of the preimage above, mapped onto G1. This point is the message
// the signer multiplies by its secret key.
G1Point BlobVerifiedHash(const StorageRoot& storage_root,
                         uint64_t epoch,
                         uint64_t quorum_id,
                         const G1Point& erasure_commitment);

}  // namespace dasigner
