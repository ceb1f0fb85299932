#include "dasigner/signer/blob_status_gate.hpp"

#include <exception>
#include <optional>
#include <string>

#include "dasigner/signer/errors.hpp"

namespace dasigner {

BlobStatusGate::BlobStatusGate(const SharedStorage& storage) : storage_(storage) {}

void BlobStatusGate::Check(uint64_t epoch,
                           uint64_t quorum_id,
                           const StorageRoot& storage_root) const {
  std::optional<BlobStatus> status;
  try {
    status = storage_.GetBlobStatus(epoch, quorum_id, storage_root);
  } catch (const std::exception& ex) {
    throw SignError(SignErrorKind::kDependencyFailure,
                    std::string("failed to read blob status: ") + ex.what());
  }

  if (!status.has_value()) {
    throw SignError(SignErrorKind::kLifecycleViolation, "blob not found");
  }
  switch (*status) {
    case BlobStatus::kUploaded:
      return;
    case BlobStatus::kVerified:
      throw SignError(SignErrorKind::kLifecycleViolation, "blob verified already");
  }
  throw SignError(SignErrorKind::kDependencyFailure, "blob status record is corrupt");
}

}  // namespace dasigner
