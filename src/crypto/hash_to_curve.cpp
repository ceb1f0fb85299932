#include "dasigner/crypto/hash_to_curve.hpp"

#include "dasigner/crypto/hash.hpp"

namespace dasigner {
namespace {

void AppendU64AsWord(uint64_t value, Bytes* out) {
  out->insert(out->end(), 24, 0);
  for (int shift = 56; shift >= 0; shift -= 8) {
    out->push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
  }
}

const mpz_class& SqrtExponent() {
  static const mpz_class kExponent = (FieldElement::ModulusQ() + 1) / 4;
  return kExponent;
}

}  // namespace

Bytes BlobVerifiedPreimage(const StorageRoot& storage_root,
                           uint64_t epoch,
                           uint64_t quorum_id,
                           const G1Point& erasure_commitment) {
  const VerifierG1Encoding commitment = SerializeForVerifier(erasure_commitment);

  Bytes out;
  out.reserve(kBlobVerifiedPreimageLen);
  out.insert(out.end(), storage_root.begin(), storage_root.end());
  AppendU64AsWord(epoch, &out);
  AppendU64AsWord(quorum_id, &out);
  out.insert(out.end(), commitment.x.begin(), commitment.x.end());
  out.insert(out.end(), commitment.y.begin(), commitment.y.end());
  return out;
}

G1Point MapToG1(const Bytes32& digest) {
  const FieldElement one = FieldElement::FromUint64(1);
  const FieldElement b = FieldElement::FromUint64(3);

  FieldElement x = FieldElement::FromBigEndianModQ(digest);
  while (true) {
    const FieldElement beta = x.Square() * x + b;
    const FieldElement y = beta.Pow(SqrtExponent());
    if (y.Square() == beta) {
      return G1Point::FromAffineUnchecked(x, y);
    }
    x = x + one;
  }
}

G1Point BlobVerifiedHash(const StorageRoot& storage_root,
                         uint64_t epoch,
                         uint64_t quorum_id,
                         const G1Point& erasure_commitment) {
  const Bytes preimage = BlobVerifiedPreimage(storage_root, epoch, quorum_id, erasure_commitment);
  return MapToG1(Keccak256(preimage));
}

}  // namespace dasigner
