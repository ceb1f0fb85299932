#pragma once

#include <string>

#include "dasigner/crypto/encoding.hpp"
#include "dasigner/crypto/g1_point.hpp"
#include "dasigner/da/encoded_slice.hpp"

namespace dasigner {

// Proof check of a single slice against the blob's erasure commitment and
// storage root. Implementations must be safe to call from several compute
// threads at once.
class ISliceVerifier {
 public:
  virtual ~ISliceVerifier() = default;

  // On failure returns false and, when `error` is non-null, describes why.
  virtual bool Verify(const EncodedSlice& slice,
                      const G1Point& erasure_commitment,
                      const StorageRoot& storage_root,
                      std::string* error) const = 0;
};

}  // namespace dasigner
