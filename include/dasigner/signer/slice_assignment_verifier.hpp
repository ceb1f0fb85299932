#pragma once

#include <cstdint>
#include <vector>

#include "dasigner/chain/chain_state.hpp"
#include "dasigner/common/compute_pool.hpp"
#include "dasigner/crypto/encoding.hpp"
#include "dasigner/crypto/g1_point.hpp"
#include "dasigner/da/encoded_slice.hpp"
#include "dasigner/da/slice_verifier.hpp"
#include "dasigner/storage/storage.hpp"

namespace dasigner {

// Checks that a request carries exactly the slices assigned to its quorum, in
// assignment order, and that each one passes its proof check.
class SliceAssignmentVerifier {
 public:
  SliceAssignmentVerifier(IChainState& chain_state,
                          const SharedStorage& storage,
                          const ISliceVerifier& slice_verifier,
                          ComputePool& compute_pool);

  // Throws SignError:
  //   kDependencyFailure   quorum count or assignment unavailable
  //   kAssignmentMismatch  quorum_id out of bound, wrong slice count or order
  //   kCryptographicFailure a slice failed its proof check
  void Verify(uint64_t epoch,
              uint64_t quorum_id,
              const StorageRoot& storage_root,
              const G1Point& erasure_commitment,
              const std::vector<EncodedSlice>& slices) const;

  // Positional check plus per-slice proof check, fanned out on the compute
  // pool. When several slices fail, the one with the lowest position is
  // reported regardless of completion order.
  void VerifyAssignedSlices(const StorageRoot& storage_root,
                            const G1Point& erasure_commitment,
                            const AssignedSlices& assigned_slices,
                            const std::vector<EncodedSlice>& slices) const;

 private:
  IChainState& chain_state_;
  const SharedStorage& storage_;
  const ISliceVerifier& slice_verifier_;
  ComputePool& compute_pool_;
};

}  // namespace dasigner
