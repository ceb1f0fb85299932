#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <tuple>
#include <vector>

#include "dasigner/storage/storage.hpp"

namespace dasigner {

// Process-local IStorage. Backs the tests and tooling; the production node
// plugs its database in behind the same interfaces.
class InMemoryStorage : public IStorage {
 public:
  std::optional<BlobStatus> GetBlobStatus(uint64_t epoch,
                                          uint64_t quorum_id,
                                          const StorageRoot& storage_root) const override;
  std::optional<AssignedSlices> GetAssignedSlices(uint64_t epoch,
                                                  uint64_t quorum_id) const override;
  void PutSlices(uint64_t epoch,
                 uint64_t quorum_id,
                 const StorageRoot& storage_root,
                 const std::vector<EncodedSlice>& slices) override;

  void SetBlobStatus(uint64_t epoch,
                     uint64_t quorum_id,
                     const StorageRoot& storage_root,
                     BlobStatus status);
  void SetAssignedSlices(uint64_t epoch, uint64_t quorum_id, AssignedSlices slices);

  std::optional<std::vector<EncodedSlice>> GetSlices(uint64_t epoch,
                                                     uint64_t quorum_id,
                                                     const StorageRoot& storage_root) const;
  size_t stored_blob_count() const;

 private:
  using BlobKey = std::tuple<uint64_t, uint64_t, StorageRoot>;
  using QuorumKey = std::tuple<uint64_t, uint64_t>;

  mutable std::mutex mu_;
  std::map<BlobKey, BlobStatus> statuses_;
  std::map<QuorumKey, AssignedSlices> assignments_;
  std::map<BlobKey, std::vector<EncodedSlice>> slices_;
};

}  // namespace dasigner
