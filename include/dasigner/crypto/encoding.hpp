#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>

#include "dasigner/common/bytes.hpp"
#include "dasigner/crypto/g1_point.hpp"

namespace dasigner {

constexpr size_t kStorageRootLen = 32;
constexpr size_t kFieldElementLen = 32;
constexpr size_t kG1UncompressedLen = 2 * kFieldElementLen;

using StorageRoot = Bytes32;

enum class CommitmentCheck {
  kMalformed = 1,
  kNotOnCurve = 2,
  kNotInSubgroup = 3,
};

const char* CommitmentCheckName(CommitmentCheck check);

class InvalidCommitmentError : public std::invalid_argument {
 public:
  InvalidCommitmentError(CommitmentCheck check, const std::string& message);

  CommitmentCheck check() const;

 private:
  CommitmentCheck check_;
};

// Throws std::invalid_argument unless `encoded` is exactly 32 bytes.
StorageRoot DecodeStorageRoot(std::span<const uint8_t> encoded);

// Two canonical little-endian Fq coordinates. Runs, in order, the encoding,
// on-curve and prime-subgroup checks and throws InvalidCommitmentError naming
// the first one that fails.
G1Point DecodeCommitment(std::span<const uint8_t> encoded);

// arkworks uncompressed layout: x || y, little-endian, with the
// short-Weierstrass flags in the two top bits of the last byte.
Bytes EncodeG1Uncompressed(const G1Point& point);
G1Point DecodeG1Uncompressed(std::span<const uint8_t> encoded);

inline Bytes EncodeSignature(const G1Point& signature) {
  return EncodeG1Uncompressed(signature);
}

// Normalized affine coordinates as 32-byte big-endian integers, the form an
// on-chain verifier receives a G1 point in.
struct VerifierG1Encoding {
  Bytes32 x{};
  Bytes32 y{};
};

VerifierG1Encoding SerializeForVerifier(const G1Point& point);

}  // namespace dasigner
