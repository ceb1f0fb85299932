#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <vector>

#include "dasigner/crypto/encoding.hpp"
#include "dasigner/da/encoded_slice.hpp"

namespace dasigner {

enum class BlobStatus : uint8_t {
  kUploaded = 1,
  kVerified = 2,
};

const char* BlobStatusName(BlobStatus status);

using AssignedSlices = std::vector<uint64_t>;

// Storage errors are reported by throwing; a missing record is std::nullopt.
class IBlobStatusStore {
 public:
  virtual ~IBlobStatusStore() = default;

  virtual std::optional<BlobStatus> GetBlobStatus(uint64_t epoch,
                                                  uint64_t quorum_id,
                                                  const StorageRoot& storage_root) const = 0;
};

class IQuorumAssignmentStore {
 public:
  virtual ~IQuorumAssignmentStore() = default;

  virtual std::optional<AssignedSlices> GetAssignedSlices(uint64_t epoch,
                                                          uint64_t quorum_id) const = 0;
};

class ISlicePersistence {
 public:
  virtual ~ISlicePersistence() = default;

  virtual void PutSlices(uint64_t epoch,
                         uint64_t quorum_id,
                         const StorageRoot& storage_root,
                         const std::vector<EncodedSlice>& slices) = 0;
};

class IStorage : public IBlobStatusStore,
                 public IQuorumAssignmentStore,
                 public ISlicePersistence {};

// The one storage handle shared by every in-flight request. Reads run under a
// shared lock, slice writes under the exclusive lock of the same handle.
class SharedStorage {
 public:
  explicit SharedStorage(std::shared_ptr<IStorage> storage);

  SharedStorage(const SharedStorage&) = delete;
  SharedStorage& operator=(const SharedStorage&) = delete;

  std::optional<BlobStatus> GetBlobStatus(uint64_t epoch,
                                          uint64_t quorum_id,
                                          const StorageRoot& storage_root) const;
  std::optional<AssignedSlices> GetAssignedSlices(uint64_t epoch, uint64_t quorum_id) const;
  void PutSlices(uint64_t epoch,
                 uint64_t quorum_id,
                 const StorageRoot& storage_root,
                 const std::vector<EncodedSlice>& slices);

 private:
  std::shared_ptr<IStorage> storage_;
  mutable std::shared_mutex mu_;
};

}  // namespace dasigner
