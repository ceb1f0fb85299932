#include "dasigner/signer/slice_assignment_verifier.hpp"

#include <atomic>
#include <exception>
#include <optional>
#include <string>
#include <utility>

#include "dasigner/common/logger.hpp"
#include "dasigner/signer/errors.hpp"

namespace dasigner {
namespace {

constexpr const char* kSliceMismatch = "received slices and assigned slices are mismatch";

Logger& VerifierLogger() {
  static Logger logger = CreateLogger("verifier");
  return logger;
}

struct SliceOutcome {
  bool ok = true;
  SignErrorKind kind = SignErrorKind::kCryptographicFailure;
  std::string detail;
};

SliceOutcome Failure(SignErrorKind kind, std::string detail) {
  return SliceOutcome{.ok = false, .kind = kind, .detail = std::move(detail)};
}

void RecordFailure(size_t position, std::atomic<size_t>* first_failure) {
  size_t current = first_failure->load();
  while (position < current && !first_failure->compare_exchange_weak(current, position)) {
  }
}

}  // namespace

SliceAssignmentVerifier::SliceAssignmentVerifier(IChainState& chain_state,
                                                 const SharedStorage& storage,
                                                 const ISliceVerifier& slice_verifier,
                                                 ComputePool& compute_pool)
    : chain_state_(chain_state),
      storage_(storage),
      slice_verifier_(slice_verifier),
      compute_pool_(compute_pool) {}

void SliceAssignmentVerifier::Verify(uint64_t epoch,
                                     uint64_t quorum_id,
                                     const StorageRoot& storage_root,
                                     const G1Point& erasure_commitment,
                                     const std::vector<EncodedSlice>& slices) const {
  uint64_t quorum_count = 0;
  try {
    quorum_count = chain_state_.FetchQuorumCountIfMissing(epoch);
  } catch (const std::exception& ex) {
    throw SignError(SignErrorKind::kDependencyFailure,
                    "internal error on verification: failed to fetch quorum count for epoch " +
                        std::to_string(epoch) + ": " + ex.what());
  }

  if (quorum_id >= quorum_count) {
    VerifierLogger()->warn("quorum_id {} out of bound, epoch {} has {} quorums", quorum_id, epoch,
                           quorum_count);
    throw SignError(SignErrorKind::kAssignmentMismatch, "quorum_id out of bound");
  }

  std::optional<AssignedSlices> assigned;
  try {
    assigned = storage_.GetAssignedSlices(epoch, quorum_id);
  } catch (const std::exception& ex) {
    throw SignError(SignErrorKind::kDependencyFailure,
                    std::string("internal error on verification: ") + ex.what());
  }
  if (!assigned.has_value()) {
    throw SignError(SignErrorKind::kDependencyFailure,
                    "internal error on verification: quorum not found");
  }

  VerifyAssignedSlices(storage_root, erasure_commitment, *assigned, slices);
}

void SliceAssignmentVerifier::VerifyAssignedSlices(const StorageRoot& storage_root,
                                                   const G1Point& erasure_commitment,
                                                   const AssignedSlices& assigned_slices,
                                                   const std::vector<EncodedSlice>& slices) const {
  if (assigned_slices.size() != slices.size()) {
    VerifierLogger()->warn("expected {} slices, received {}", assigned_slices.size(),
                           slices.size());
    throw SignError(SignErrorKind::kAssignmentMismatch, kSliceMismatch);
  }

  // Positions above a known failure cannot change the outcome and are skipped.
  std::atomic<size_t> first_failure(slices.size());

  const std::vector<SliceOutcome> outcomes = compute_pool_.MapIndexed(
      slices.size(), [&](size_t position) -> SliceOutcome {
        if (first_failure.load() < position) {
          return SliceOutcome{};
        }

        const EncodedSlice& slice = slices[position];
        if (slice.index != assigned_slices[position]) {
          RecordFailure(position, &first_failure);
          return Failure(SignErrorKind::kAssignmentMismatch,
                         "slice at position " + std::to_string(position) + " has index " +
                             std::to_string(slice.index) + ", expected " +
                             std::to_string(assigned_slices[position]));
        }

        std::string error;
        bool valid = false;
        try {
          valid = slice_verifier_.Verify(slice, erasure_commitment, storage_root, &error);
        } catch (const std::exception& ex) {
          error = ex.what();
        }
        if (!valid) {
          RecordFailure(position, &first_failure);
          return Failure(SignErrorKind::kCryptographicFailure,
                         "slice " + std::to_string(slice.index) + ": " +
                             (error.empty() ? "invalid proof" : error));
        }
        return SliceOutcome{};
      });

  for (const SliceOutcome& outcome : outcomes) {
    if (outcome.ok) {
      continue;
    }
    VerifierLogger()->warn("slice verification failed: {}", outcome.detail);
    if (outcome.kind == SignErrorKind::kAssignmentMismatch) {
      throw SignError(outcome.kind, std::string(kSliceMismatch) + ": " + outcome.detail);
    }
    throw SignError(outcome.kind, "verification failed: " + outcome.detail);
  }
}

}  // namespace dasigner
