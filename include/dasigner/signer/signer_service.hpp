#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "dasigner/chain/chain_state.hpp"
#include "dasigner/common/compute_pool.hpp"
#include "dasigner/common/logger.hpp"
#include "dasigner/common/status.hpp"
#include "dasigner/crypto/encoding.hpp"
#include "dasigner/crypto/g1_point.hpp"
#include "dasigner/crypto/scalar.hpp"
#include "dasigner/da/encoded_slice.hpp"
#include "dasigner/da/slice_verifier.hpp"
#include "dasigner/signer/admission_controller.hpp"
#include "dasigner/signer/blob_status_gate.hpp"
#include "dasigner/signer/config.hpp"
#include "dasigner/signer/slice_assignment_verifier.hpp"
#include "dasigner/signer/types.hpp"
#include "dasigner/storage/storage.hpp"

namespace dasigner {

// Batch verify-and-sign endpoint of a DA signer node.
//
// Every request of a batch is decoded, checked against the blob status, its
// quorum assignment and the slice proofs, then signed. A batch either yields
// one signature per request or a single error; verified slices are written
// to storage only after the whole batch has been signed.
//
// BatchSign may be called from any number of threads.
class SignerService {
 public:
  // The key in `config` is wiped once copied; move the caller's config in, or
  // SecureZeroize the caller's copy of signer_private_key after construction.
  SignerService(std::shared_ptr<SharedStorage> storage,
                std::shared_ptr<IChainState> chain_state,
                std::shared_ptr<const ISliceVerifier> slice_verifier,
                SignerConfig config);
  ~SignerService();

  SignerService(const SignerService&) = delete;
  SignerService& operator=(const SignerService&) = delete;

  // On failure `reply` is left empty and the status names the failing request
  // index and check.
  Status BatchSign(const BatchSignRequest& request, BatchSignReply* reply);

  const AdmissionController& admission() const;

 private:
  struct DecodedRequest {
    StorageRoot storage_root{};
    G1Point erasure_commitment;
    std::vector<EncodedSlice> slices;
  };

  struct PendingWrite {
    uint64_t epoch = 0;
    uint64_t quorum_id = 0;
    StorageRoot storage_root{};
    std::vector<EncodedSlice> slices;
  };

  std::vector<Bytes> BatchSignInner(const BatchSignRequest& request);
  Bytes ProcessRequest(const SignRequest& request, std::vector<PendingWrite>* writes) const;
  DecodedRequest Decode(const SignRequest& request) const;
  Bytes Sign(const SignRequest& request, const DecodedRequest& decoded) const;
  void CommitWrites(const std::vector<PendingWrite>& writes);

  Scalar signer_private_key_;
  size_t max_slice_payload_len_;
  Logger logger_;

  std::shared_ptr<SharedStorage> storage_;
  std::shared_ptr<IChainState> chain_state_;
  std::shared_ptr<const ISliceVerifier> slice_verifier_;
  std::unique_ptr<ComputePool> compute_pool_;

  AdmissionController admission_;
  BlobStatusGate status_gate_;
  SliceAssignmentVerifier assignment_verifier_;
};

}  // namespace dasigner
