#include "dasigner/crypto/encoding.hpp"

#include <algorithm>
#include <array>

#include "dasigner/common/logger.hpp"

namespace dasigner {
namespace {

constexpr uint8_t kYIsNegativeFlag = 0x80;
constexpr uint8_t kInfinityFlag = 0x40;
constexpr uint8_t kFlagsMask = kYIsNegativeFlag | kInfinityFlag;

Logger& CodecLogger() {
  static Logger logger = CreateLogger("codec");
  return logger;
}

// arkworks calls y "negative" when it is the larger of {y, -y}.
bool IsLexicographicallyLargest(const FieldElement& y) {
  return y.value() > (-y).value();
}

[[noreturn]] void RejectCommitment(CommitmentCheck check, const std::string& message) {
  CodecLogger()->warn("rejecting erasure commitment ({}): {}", CommitmentCheckName(check),
                      message);
  throw InvalidCommitmentError(check, message);
}

}  // namespace

const char* CommitmentCheckName(CommitmentCheck check) {
  switch (check) {
    case CommitmentCheck::kMalformed:
      return "malformed";
    case CommitmentCheck::kNotOnCurve:
      return "not on curve";
    case CommitmentCheck::kNotInSubgroup:
      return "not in subgroup";
  }
  return "unknown";
}

InvalidCommitmentError::InvalidCommitmentError(CommitmentCheck check, const std::string& message)
    : std::invalid_argument(message), check_(check) {}

CommitmentCheck InvalidCommitmentError::check() const {
  return check_;
}

StorageRoot DecodeStorageRoot(std::span<const uint8_t> encoded) {
  if (encoded.size() != kStorageRootLen) {
    throw std::invalid_argument("storage root must be exactly 32 bytes, got " +
                                std::to_string(encoded.size()));
  }

  StorageRoot out{};
  std::copy(encoded.begin(), encoded.end(), out.begin());
  return out;
}

G1Point DecodeCommitment(std::span<const uint8_t> encoded) {
  if (encoded.size() != kG1UncompressedLen) {
    RejectCommitment(CommitmentCheck::kMalformed,
                     "failed to deserialize erasure commitment: expected 64 bytes, got " +
                         std::to_string(encoded.size()));
  }

  FieldElement x;
  FieldElement y;
  try {
    x = FieldElement::FromCanonicalLittleEndian(encoded.subspan(0, kFieldElementLen));
    y = FieldElement::FromCanonicalLittleEndian(encoded.subspan(kFieldElementLen));
  } catch (const std::invalid_argument& ex) {
    RejectCommitment(CommitmentCheck::kMalformed,
                     std::string("failed to deserialize erasure commitment: ") + ex.what());
  }

  const G1Point commitment = G1Point::FromAffineUnchecked(x, y);
  if (!commitment.IsOnCurve()) {
    RejectCommitment(CommitmentCheck::kNotOnCurve, "commitment is not on curve");
  }
  if (!commitment.IsInPrimeSubgroup()) {
    RejectCommitment(CommitmentCheck::kNotInSubgroup, "commitment is not in group");
  }
  return commitment;
}

Bytes EncodeG1Uncompressed(const G1Point& point) {
  Bytes out;
  out.reserve(kG1UncompressedLen);

  if (point.IsInfinity()) {
    out.assign(kG1UncompressedLen, 0);
    out.back() |= kInfinityFlag;
    return out;
  }

  const auto x = point.x().ToLittleEndianBytes();
  const auto y = point.y().ToLittleEndianBytes();
  out.insert(out.end(), x.begin(), x.end());
  out.insert(out.end(), y.begin(), y.end());
  if (IsLexicographicallyLargest(point.y())) {
    out.back() |= kYIsNegativeFlag;
  }
  return out;
}

G1Point DecodeG1Uncompressed(std::span<const uint8_t> encoded) {
  if (encoded.size() != kG1UncompressedLen) {
    throw std::invalid_argument("G1 point encoding must be exactly 64 bytes");
  }

  std::array<uint8_t, kFieldElementLen> y_bytes{};
  std::copy(encoded.begin() + kFieldElementLen, encoded.end(), y_bytes.begin());
  const uint8_t flags = y_bytes.back() & kFlagsMask;
  y_bytes.back() &= static_cast<uint8_t>(~kFlagsMask);

  if ((flags & kInfinityFlag) != 0) {
    return G1Point();
  }

  const FieldElement x = FieldElement::FromCanonicalLittleEndian(encoded.subspan(0, kFieldElementLen));
  const FieldElement y = FieldElement::FromCanonicalLittleEndian(y_bytes);
  return G1Point::FromAffine(x, y);
}

VerifierG1Encoding SerializeForVerifier(const G1Point& point) {
  VerifierG1Encoding out;
  if (point.IsInfinity()) {
    return out;
  }
  out.x = point.x().ToBigEndianBytes();
  out.y = point.y().ToBigEndianBytes();
  return out;
}

}  // namespace dasigner
