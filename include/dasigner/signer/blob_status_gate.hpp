#pragma once

#include <cstdint>

#include "dasigner/crypto/encoding.hpp"
#include "dasigner/storage/storage.hpp"

namespace dasigner {

// Only blobs still in the Uploaded state may be signed. The move to Verified
// is made by another component once the quorum's signatures are aggregated.
class BlobStatusGate {
 public:
  explicit BlobStatusGate(const SharedStorage& storage);

  // Throws SignError: kLifecycleViolation for a verified or unknown blob,
  // kDependencyFailure when the status cannot be read.
  void Check(uint64_t epoch, uint64_t quorum_id, const StorageRoot& storage_root) const;

 private:
  const SharedStorage& storage_;
};

}  // namespace dasigner
