#include "dasigner/signer/signer_service.hpp"

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

#include "dasigner/common/secure_zeroize.hpp"
#include "dasigner/crypto/hash_to_curve.hpp"
#include "dasigner/signer/errors.hpp"

namespace dasigner {
namespace {

template <typename T>
std::shared_ptr<T> RequireNonNull(std::shared_ptr<T> ptr, const char* name) {
  if (ptr == nullptr) {
    throw std::invalid_argument(std::string("SignerService requires ") + name);
  }
  return ptr;
}

Scalar RequireSignerKey(const SignerConfig& config) {
  if (!config.signer_private_key.has_value() || config.signer_private_key->IsZero()) {
    throw std::invalid_argument("SignerService requires a non-zero signer private key");
  }
  return *config.signer_private_key;
}

std::string RequestPrefix(size_t index) {
  return "request " + std::to_string(index) + ": ";
}

}  // namespace

SignerService::SignerService(std::shared_ptr<SharedStorage> storage,
                             std::shared_ptr<IChainState> chain_state,
                             std::shared_ptr<const ISliceVerifier> slice_verifier,
                             SignerConfig config)
    : signer_private_key_(RequireSignerKey(config)),
      max_slice_payload_len_(config.max_slice_payload_len),
      logger_(CreateLogger("signer")),
      storage_(RequireNonNull(std::move(storage), "a storage handle")),
      chain_state_(RequireNonNull(std::move(chain_state), "a chain state")),
      slice_verifier_(RequireNonNull(std::move(slice_verifier), "a slice verifier")),
      compute_pool_(std::make_unique<ComputePool>(
          ComputePool::ResolveWorkerCount(config.max_verify_threads))),
      admission_(config.max_ongoing_sign_request),
      status_gate_(*storage_),
      assignment_verifier_(*chain_state_, *storage_, *slice_verifier_, *compute_pool_) {
  SecureZeroize(&config.signer_private_key);
  logger_->info("signer service ready: max {} ongoing batch calls, {} verify threads",
                admission_.max_ongoing(), compute_pool_->worker_count());
}

SignerService::~SignerService() {
  SecureZeroize(&signer_private_key_);
}

Status SignerService::BatchSign(const BatchSignRequest& request, BatchSignReply* reply) {
  if (reply == nullptr) {
    throw std::invalid_argument("BatchSign reply must not be null");
  }
  reply->signatures.clear();

  try {
    AdmissionPermit permit = admission_.Enter();
    reply->signatures = BatchSignInner(request);
    return Status::Ok();
  } catch (const SignError& ex) {
    return Status(ToStatusCode(ex.kind()), ex.what());
  } catch (const std::exception& ex) {
    logger_->error("batch sign from {} failed unexpectedly: {}", request.peer, ex.what());
    return Status(StatusCode::kInternal, ex.what());
  }
}

const AdmissionController& SignerService::admission() const {
  return admission_;
}

std::vector<Bytes> SignerService::BatchSignInner(const BatchSignRequest& request) {
  logger_->info("received batch sign request from {} with {} requests",
                request.peer.empty() ? "<unknown>" : request.peer, request.requests.size());

  std::vector<Bytes> signatures;
  signatures.reserve(request.requests.size());
  std::vector<PendingWrite> writes;
  writes.reserve(request.requests.size());

  for (size_t i = 0; i < request.requests.size(); ++i) {
    try {
      signatures.push_back(ProcessRequest(request.requests[i], &writes));
    } catch (const SignError& ex) {
      logger_->warn("{}{} ({})", RequestPrefix(i), ex.what(), SignErrorKindName(ex.kind()));
      throw SignError(ex.kind(), RequestPrefix(i) + ex.what());
    } catch (const std::exception& ex) {
      logger_->error("{}unexpected failure: {}", RequestPrefix(i), ex.what());
      throw SignError(SignErrorKind::kDependencyFailure, RequestPrefix(i) + ex.what());
    }
  }

  CommitWrites(writes);
  logger_->info("signed batch of {} requests from {}", signatures.size(),
                request.peer.empty() ? "<unknown>" : request.peer);
  return signatures;
}

Bytes SignerService::ProcessRequest(const SignRequest& request,
                                    std::vector<PendingWrite>* writes) const {
  DecodedRequest decoded = Decode(request);

  status_gate_.Check(request.epoch, request.quorum_id, decoded.storage_root);

  assignment_verifier_.Verify(request.epoch, request.quorum_id, decoded.storage_root,
                              decoded.erasure_commitment, decoded.slices);

  Bytes signature = Sign(request, decoded);

  writes->push_back(PendingWrite{
      .epoch = request.epoch,
      .quorum_id = request.quorum_id,
      .storage_root = decoded.storage_root,
      .slices = std::move(decoded.slices),
  });
  return signature;
}

SignerService::DecodedRequest SignerService::Decode(const SignRequest& request) const {
  DecodedRequest out;

  try {
    out.storage_root = DecodeStorageRoot(request.storage_root);
  } catch (const std::invalid_argument& ex) {
    throw SignError(SignErrorKind::kMalformedInput, std::string("storage root: ") + ex.what());
  }

  try {
    out.erasure_commitment = DecodeCommitment(request.erasure_commitment);
  } catch (const InvalidCommitmentError& ex) {
    throw SignError(SignErrorKind::kMalformedInput,
                    std::string("incorrect commitment: ") + ex.what());
  }

  out.slices.reserve(request.encoded_slice.size());
  for (size_t i = 0; i < request.encoded_slice.size(); ++i) {
    try {
      out.slices.push_back(DecodeSlice(request.encoded_slice[i], max_slice_payload_len_));
    } catch (const std::invalid_argument& ex) {
      throw SignError(SignErrorKind::kMalformedInput, "failed to deserialize slice " +
                                                          std::to_string(i) + ": " + ex.what());
    }
  }
  return out;
}

Bytes SignerService::Sign(const SignRequest& request, const DecodedRequest& decoded) const {
  const G1Point message = BlobVerifiedHash(decoded.storage_root, request.epoch,
                                           request.quorum_id, decoded.erasure_commitment);
  return EncodeSignature(message.Mul(signer_private_key_));
}

void SignerService::CommitWrites(const std::vector<PendingWrite>& writes) {
  for (size_t i = 0; i < writes.size(); ++i) {
    const PendingWrite& write = writes[i];
    try {
      storage_->PutSlices(write.epoch, write.quorum_id, write.storage_root, write.slices);
    } catch (const std::exception& ex) {
      logger_->error("{}put slice error after {} of {} writes: {}", RequestPrefix(i), i,
                     writes.size(), ex.what());
      throw SignError(SignErrorKind::kDependencyFailure,
                      RequestPrefix(i) + "put slice error: " + ex.what());
    }
  }
}

}  // namespace dasigner
