#include "dasigner/storage/storage.hpp"

#include <mutex>
#include <stdexcept>
#include <utility>

namespace dasigner {

const char* BlobStatusName(BlobStatus status) {
  switch (status) {
    case BlobStatus::kUploaded:
      return "uploaded";
    case BlobStatus::kVerified:
      return "verified";
  }
  return "unknown";
}

SharedStorage::SharedStorage(std::shared_ptr<IStorage> storage) : storage_(std::move(storage)) {
  if (storage_ == nullptr) {
    throw std::invalid_argument("SharedStorage requires a storage backend");
  }
}

std::optional<BlobStatus> SharedStorage::GetBlobStatus(uint64_t epoch,
                                                       uint64_t quorum_id,
                                                       const StorageRoot& storage_root) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return storage_->GetBlobStatus(epoch, quorum_id, storage_root);
}

std::optional<AssignedSlices> SharedStorage::GetAssignedSlices(uint64_t epoch,
                                                               uint64_t quorum_id) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return storage_->GetAssignedSlices(epoch, quorum_id);
}

void SharedStorage::PutSlices(uint64_t epoch,
                              uint64_t quorum_id,
                              const StorageRoot& storage_root,
                              const std::vector<EncodedSlice>& slices) {
  std::unique_lock<std::shared_mutex> lock(mu_);
  storage_->PutSlices(epoch, quorum_id, storage_root, slices);
}

}  // namespace dasigner
