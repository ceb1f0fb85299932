#include "dasigner/storage/in_memory_storage.hpp"

#include <utility>

namespace dasigner {

std::optional<BlobStatus> InMemoryStorage::GetBlobStatus(uint64_t epoch,
                                                         uint64_t quorum_id,
                                                         const StorageRoot& storage_root) const {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = statuses_.find(BlobKey(epoch, quorum_id, storage_root));
  if (it == statuses_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<AssignedSlices> InMemoryStorage::GetAssignedSlices(uint64_t epoch,
                                                                 uint64_t quorum_id) const {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = assignments_.find(QuorumKey(epoch, quorum_id));
  if (it == assignments_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void InMemoryStorage::PutSlices(uint64_t epoch,
                                uint64_t quorum_id,
                                const StorageRoot& storage_root,
                                const std::vector<EncodedSlice>& slices) {
  std::lock_guard<std::mutex> lock(mu_);
  slices_[BlobKey(epoch, quorum_id, storage_root)] = slices;
}

void InMemoryStorage::SetBlobStatus(uint64_t epoch,
                                    uint64_t quorum_id,
                                    const StorageRoot& storage_root,
                                    BlobStatus status) {
  std::lock_guard<std::mutex> lock(mu_);
  statuses_[BlobKey(epoch, quorum_id, storage_root)] = status;
}

void InMemoryStorage::SetAssignedSlices(uint64_t epoch, uint64_t quorum_id, AssignedSlices slices) {
  std::lock_guard<std::mutex> lock(mu_);
  assignments_[QuorumKey(epoch, quorum_id)] = std::move(slices);
}

std::optional<std::vector<EncodedSlice>> InMemoryStorage::GetSlices(
    uint64_t epoch,
    uint64_t quorum_id,
    const StorageRoot& storage_root) const {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = slices_.find(BlobKey(epoch, quorum_id, storage_root));
  if (it == slices_.end()) {
    return std::nullopt;
  }
  return it->second;
}

size_t InMemoryStorage::stored_blob_count() const {
  std::lock_guard<std::mutex> lock(mu_);
  return slices_.size();
}

}  // namespace dasigner
