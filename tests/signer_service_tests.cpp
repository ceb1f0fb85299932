#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "dasigner/chain/chain_state.hpp"
#include "dasigner/common/bytes.hpp"
#include "dasigner/common/secure_zeroize.hpp"
#include "dasigner/common/status.hpp"
#include "dasigner/crypto/bigint.hpp"
#include "dasigner/crypto/encoding.hpp"
#include "dasigner/crypto/g1_point.hpp"
#include "dasigner/crypto/hash_to_curve.hpp"
#include "dasigner/crypto/scalar.hpp"
#include "dasigner/da/encoded_slice.hpp"
#include "dasigner/da/slice_verifier.hpp"
#include "dasigner/signer/config.hpp"
#include "dasigner/signer/signer_service.hpp"
#include "dasigner/signer/types.hpp"
#include "dasigner/storage/in_memory_storage.hpp"
#include "dasigner/storage/storage.hpp"

namespace {

using dasigner::BatchSignReply;
using dasigner::BatchSignRequest;
using dasigner::BlobStatus;
using dasigner::Bytes;
using dasigner::EncodedSlice;
using dasigner::G1Point;
using dasigner::InMemoryStorage;
using dasigner::ISliceVerifier;
using dasigner::QuorumCountCache;
using dasigner::Scalar;
using dasigner::SharedStorage;
using dasigner::SignerConfig;
using dasigner::SignerService;
using dasigner::SignRequest;
using dasigner::Status;
using dasigner::StatusCode;
using dasigner::StorageRoot;

constexpr uint8_t kValidProofTag = 0xAA;
constexpr uint64_t kEpoch = 1;

void Expect(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error("Test failed: " + message);
  }
}

void ExpectThrow(const std::function<void()>& fn, const std::string& message) {
  try {
    fn();
  } catch (const std::exception&) {
    return;
  }
  throw std::runtime_error("Expected exception: " + message);
}

void ExpectStatus(const Status& status,
                  StatusCode code,
                  const std::string& needle,
                  const std::string& message) {
  Expect(status.code() == code, message + " (got " + status.ToString() + ")");
  Expect(status.message().find(needle) != std::string::npos,
         message + " (got " + status.ToString() + ")");
}

class TaggedSliceVerifier : public ISliceVerifier {
 public:
  bool Verify(const EncodedSlice& slice,
              const G1Point&,
              const StorageRoot&,
              std::string* error) const override {
    if (!slice.payload.empty() && slice.payload[0] == kValidProofTag) {
      return true;
    }
    if (error != nullptr) {
      *error = "bad proof";
    }
    return false;
  }
};

// Holds every verification until Release() so that calls stay in flight.
class GatedSliceVerifier : public ISliceVerifier {
 public:
  bool Verify(const EncodedSlice&,
              const G1Point&,
              const StorageRoot&,
              std::string*) const override {
    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait(lock, [this]() { return released_; });
    return true;
  }

  void Release() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      released_ = true;
    }
    cv_.notify_all();
  }

 private:
  mutable std::mutex mu_;
  mutable std::condition_variable cv_;
  bool released_ = false;
};

class ReadOnlyStorage : public InMemoryStorage {
 public:
  void PutSlices(uint64_t, uint64_t, const StorageRoot&, const std::vector<EncodedSlice>&) override {
    throw std::runtime_error("disk full");
  }
};

// Accepts the first slice write and fails every later one.
class FlakyStorage : public InMemoryStorage {
 public:
  void PutSlices(uint64_t epoch,
                 uint64_t quorum_id,
                 const StorageRoot& storage_root,
                 const std::vector<EncodedSlice>& slices) override {
    if (writes_++ > 0) {
      throw std::runtime_error("connection reset");
    }
    InMemoryStorage::PutSlices(epoch, quorum_id, storage_root, slices);
  }

 private:
  int writes_ = 0;
};

Scalar TestKey() {
  return Scalar::FromUint64(0x5eed5eed5eedULL);
}

SignerConfig TestConfig() {
  SignerConfig config;
  config.signer_private_key = TestKey();
  config.max_verify_threads = 4;
  return config;
}

StorageRoot MakeRoot(uint8_t fill) {
  StorageRoot root{};
  root.fill(fill);
  return root;
}

G1Point TestCommitment() {
  return G1Point::GeneratorMultiply(Scalar::FromUint64(7));
}

Bytes EncodeCommitment(const G1Point& point) {
  const auto x = dasigner::ExportLittleEndian32(point.x().value());
  const auto y = dasigner::ExportLittleEndian32(point.y().value());
  Bytes out(x.begin(), x.end());
  out.insert(out.end(), y.begin(), y.end());
  return out;
}

SignRequest MakeRequest(uint64_t quorum_id,
                        const StorageRoot& root,
                        const std::vector<uint64_t>& indices) {
  SignRequest request;
  request.epoch = kEpoch;
  request.quorum_id = quorum_id;
  request.storage_root.assign(root.begin(), root.end());
  request.erasure_commitment = EncodeCommitment(TestCommitment());
  for (uint64_t index : indices) {
    request.encoded_slice.push_back(dasigner::EncodeSlice(
        EncodedSlice{.index = index, .payload = Bytes{kValidProofTag, static_cast<uint8_t>(index)}}));
  }
  return request;
}

std::shared_ptr<InMemoryStorage> SeedStorage(std::shared_ptr<InMemoryStorage> backend) {
  backend->SetAssignedSlices(kEpoch, 0, {3, 7, 9});
  backend->SetAssignedSlices(kEpoch, 1, {0, 1});
  backend->SetBlobStatus(kEpoch, 0, MakeRoot(0x10), BlobStatus::kUploaded);
  backend->SetBlobStatus(kEpoch, 1, MakeRoot(0x10), BlobStatus::kUploaded);
  backend->SetBlobStatus(kEpoch, 0, MakeRoot(0x20), BlobStatus::kVerified);
  return backend;
}

std::shared_ptr<QuorumCountCache> MakeChain() {
  auto chain = std::make_shared<QuorumCountCache>([](uint64_t epoch) -> uint64_t {
    throw std::runtime_error("epoch " + std::to_string(epoch) + " not synced");
  });
  chain->Put(kEpoch, 2);
  return chain;
}

struct Node {
  explicit Node(std::shared_ptr<InMemoryStorage> storage = std::make_shared<InMemoryStorage>(),
                std::shared_ptr<const ISliceVerifier> verifier =
                    std::make_shared<TaggedSliceVerifier>(),
                const SignerConfig& config = TestConfig())
      : backend(SeedStorage(std::move(storage))),
        service(std::make_shared<SharedStorage>(backend), MakeChain(), std::move(verifier),
                config) {}

  std::shared_ptr<InMemoryStorage> backend;
  SignerService service;
};

void TestSignsAndPersistsBatch() {
  Node node;
  BatchSignRequest batch;
  batch.peer = "10.0.0.7:4100";
  batch.requests.push_back(MakeRequest(0, MakeRoot(0x10), {3, 7, 9}));
  batch.requests.push_back(MakeRequest(1, MakeRoot(0x10), {0, 1}));

  BatchSignReply reply;
  const Status status = node.service.BatchSign(batch, &reply);
  Expect(status.ok(), "Valid batch must be signed: " + status.ToString());
  Expect(reply.signatures.size() == 2, "One signature per request");

  for (uint64_t quorum_id = 0; quorum_id < 2; ++quorum_id) {
    const G1Point expected =
        dasigner::BlobVerifiedHash(MakeRoot(0x10), kEpoch, quorum_id, TestCommitment())
            .Mul(TestKey());
    Expect(reply.signatures[quorum_id] == dasigner::EncodeSignature(expected),
           "Signature must be the blob hash point times the key");
    Expect(dasigner::DecodeG1Uncompressed(reply.signatures[quorum_id]) == expected,
           "Signature must decode to the signed point");
  }
  Expect(reply.signatures[0] != reply.signatures[1], "Quorum id is part of the signed message");

  const auto stored = node.backend->GetSlices(kEpoch, 0, MakeRoot(0x10));
  Expect(stored.has_value() && stored->size() == 3, "Verified slices must be persisted");
  Expect((*stored)[1].index == 7, "Slices are stored in received order");
  Expect(node.backend->stored_blob_count() == 2, "Both blobs must be persisted");
  Expect(node.service.admission().ongoing() == 0, "Permit is released after the call");
}

void TestEmptyBatch() {
  Node node;
  BatchSignReply reply;
  reply.signatures.push_back(Bytes{1});
  const Status status = node.service.BatchSign(BatchSignRequest{}, &reply);
  Expect(status.ok(), "Empty batch succeeds");
  Expect(reply.signatures.empty(), "Empty batch yields no signatures");
}

void TestBatchIsAllOrNothing() {
  Node node;
  BatchSignRequest batch;
  batch.requests.push_back(MakeRequest(0, MakeRoot(0x10), {3, 7, 9}));
  batch.requests.push_back(MakeRequest(0, MakeRoot(0x30), {3, 7, 9}));

  BatchSignReply reply;
  const Status status = node.service.BatchSign(batch, &reply);
  ExpectStatus(status, StatusCode::kInternal, "request 1", "Unknown blob fails the batch");
  ExpectStatus(status, StatusCode::kInternal, "blob not found", "Failure names the check");
  Expect(reply.signatures.empty(), "No partial signatures");
  Expect(node.backend->stored_blob_count() == 0, "No slices persisted for a failed batch");
  Expect(node.service.admission().ongoing() == 0, "Permit is released after a failed call");
}

void TestLifecycleAndAssignmentErrors() {
  Node node;
  BatchSignReply reply;

  BatchSignRequest verified;
  verified.requests.push_back(MakeRequest(0, MakeRoot(0x20), {3, 7, 9}));
  ExpectStatus(node.service.BatchSign(verified, &reply), StatusCode::kInternal,
               "blob verified already", "Verified blob is not signed again");

  BatchSignRequest reordered;
  reordered.requests.push_back(MakeRequest(0, MakeRoot(0x10), {3, 9, 7}));
  ExpectStatus(node.service.BatchSign(reordered, &reply), StatusCode::kInvalidArgument,
               "mismatch", "Reordered slices are rejected");

  BatchSignRequest bad_proof;
  bad_proof.requests.push_back(MakeRequest(1, MakeRoot(0x10), {0, 1}));
  bad_proof.requests[0].encoded_slice[1] =
      dasigner::EncodeSlice(EncodedSlice{.index = 1, .payload = Bytes{0x00}});
  ExpectStatus(node.service.BatchSign(bad_proof, &reply), StatusCode::kInvalidArgument,
               "verification failed", "Bad slice proof is rejected");

  Expect(reply.signatures.empty(), "Failed calls leave the reply empty");
  Expect(node.backend->stored_blob_count() == 0, "Nothing persisted");
  Expect(node.service.admission().ongoing() == 0, "Permits are released after failed calls");
}

void TestMalformedInputs() {
  Node node;
  BatchSignReply reply;

  BatchSignRequest short_commitment;
  short_commitment.requests.push_back(MakeRequest(0, MakeRoot(0x10), {3, 7, 9}));
  short_commitment.requests[0].erasure_commitment.pop_back();
  ExpectStatus(node.service.BatchSign(short_commitment, &reply), StatusCode::kInvalidArgument,
               "incorrect commitment", "63-byte commitment is rejected");

  BatchSignRequest off_curve;
  off_curve.requests.push_back(MakeRequest(0, MakeRoot(0x10), {3, 7, 9}));
  off_curve.requests[0].erasure_commitment = EncodeCommitment(G1Point::FromAffineUnchecked(
      dasigner::FieldElement::FromUint64(1), dasigner::FieldElement::FromUint64(3)));
  ExpectStatus(node.service.BatchSign(off_curve, &reply), StatusCode::kInvalidArgument,
               "incorrect commitment", "Off-curve commitment is rejected");

  BatchSignRequest short_root;
  short_root.requests.push_back(MakeRequest(0, MakeRoot(0x10), {3, 7, 9}));
  short_root.requests[0].storage_root.resize(31);
  ExpectStatus(node.service.BatchSign(short_root, &reply), StatusCode::kInvalidArgument,
               "storage root", "31-byte root is rejected");

  BatchSignRequest truncated_slice;
  truncated_slice.requests.push_back(MakeRequest(0, MakeRoot(0x10), {3, 7, 9}));
  truncated_slice.requests[0].encoded_slice[2].pop_back();
  ExpectStatus(node.service.BatchSign(truncated_slice, &reply), StatusCode::kInvalidArgument,
               "failed to deserialize slice 2", "Truncated slice is rejected");

  // Uploaded under a quorum the epoch does not have.
  node.backend->SetBlobStatus(kEpoch, 2, MakeRoot(0x10), BlobStatus::kUploaded);
  BatchSignRequest out_of_bound;
  out_of_bound.requests.push_back(MakeRequest(2, MakeRoot(0x10), {0}));
  ExpectStatus(node.service.BatchSign(out_of_bound, &reply), StatusCode::kInvalidArgument,
               "out of bound", "Quorum beyond the epoch's count is rejected");

  BatchSignRequest unsynced_epoch;
  unsynced_epoch.requests.push_back(MakeRequest(0, MakeRoot(0x10), {3, 7, 9}));
  unsynced_epoch.requests[0].epoch = 99;
  node.backend->SetBlobStatus(99, 0, MakeRoot(0x10), BlobStatus::kUploaded);
  ExpectStatus(node.service.BatchSign(unsynced_epoch, &reply), StatusCode::kInternal,
               "not synced", "Chain lookup failures are internal");
  Expect(node.service.admission().ongoing() == 0, "Permits are released after rejected input");
}

void TestPersistenceFailure() {
  Node node(std::make_shared<ReadOnlyStorage>());
  BatchSignRequest batch;
  batch.requests.push_back(MakeRequest(0, MakeRoot(0x10), {3, 7, 9}));

  BatchSignReply reply;
  ExpectStatus(node.service.BatchSign(batch, &reply), StatusCode::kInternal, "put slice error",
               "Write failure fails the batch");
  Expect(reply.signatures.empty(), "No signatures after a write failure");
  Expect(node.service.admission().ongoing() == 0, "Permit is released after a write failure");
}

void TestPartialCommitIsKept() {
  Node node(std::make_shared<FlakyStorage>());
  BatchSignRequest batch;
  batch.requests.push_back(MakeRequest(0, MakeRoot(0x10), {3, 7, 9}));
  batch.requests.push_back(MakeRequest(1, MakeRoot(0x10), {0, 1}));

  BatchSignReply reply;
  ExpectStatus(node.service.BatchSign(batch, &reply), StatusCode::kInternal,
               "request 1: put slice error", "Second write failure fails the batch");
  Expect(reply.signatures.empty(), "No signatures after a partial commit");
  Expect(node.backend->GetSlices(kEpoch, 0, MakeRoot(0x10)).has_value(),
         "Slices written before the failure stay stored");
  Expect(!node.backend->GetSlices(kEpoch, 1, MakeRoot(0x10)).has_value(),
         "Slices of the failed write are absent");
  Expect(node.backend->stored_blob_count() == 1, "Exactly one blob committed");
}

void TestFailedCallFreesSingleSlot() {
  SignerConfig config = TestConfig();
  config.max_ongoing_sign_request = 1;
  Node node(std::make_shared<InMemoryStorage>(), std::make_shared<TaggedSliceVerifier>(), config);

  BatchSignRequest failing;
  failing.requests.push_back(MakeRequest(0, MakeRoot(0x20), {3, 7, 9}));
  BatchSignReply reply;
  ExpectStatus(node.service.BatchSign(failing, &reply), StatusCode::kInternal,
               "blob verified already", "Failing call is rejected by the status check");
  Expect(node.service.admission().ongoing() == 0, "Failing call returns its slot");

  BatchSignRequest good;
  good.requests.push_back(MakeRequest(0, MakeRoot(0x10), {3, 7, 9}));
  const Status status = node.service.BatchSign(good, &reply);
  Expect(status.ok(), "Single slot is usable after a failure: " + status.ToString());
  Expect(reply.signatures.size() == 1, "Signature after a failed call");
}

void TestAdmissionLimit() {
  auto gate = std::make_shared<GatedSliceVerifier>();
  SignerConfig config = TestConfig();
  config.max_ongoing_sign_request = 2;
  Node node(std::make_shared<InMemoryStorage>(), gate, config);

  BatchSignRequest batch;
  batch.requests.push_back(MakeRequest(1, MakeRoot(0x10), {0, 1}));

  Status held[2];
  std::vector<std::thread> callers;
  for (int i = 0; i < 2; ++i) {
    callers.emplace_back([&, i]() {
      BatchSignReply reply;
      held[i] = node.service.BatchSign(batch, &reply);
    });
  }

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
  while (node.service.admission().ongoing() < 2 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  Expect(node.service.admission().ongoing() == 2, "Both callers must be admitted");

  BatchSignReply rejected_reply;
  ExpectStatus(node.service.BatchSign(batch, &rejected_reply), StatusCode::kResourceExhausted,
               "request pool is full", "Third concurrent call is shed");
  Expect(node.service.admission().ongoing() == 2, "Rejected call takes no slot");

  gate->Release();
  for (std::thread& caller : callers) {
    caller.join();
  }
  Expect(held[0].ok() && held[1].ok(), "Admitted calls complete normally");
  Expect(node.service.admission().ongoing() == 0, "Slots are returned");

  BatchSignReply reply;
  Expect(node.service.BatchSign(batch, &reply).ok(), "Capacity is available again");
}

void TestServiceConstruction() {
  auto storage = std::make_shared<SharedStorage>(std::make_shared<InMemoryStorage>());
  auto verifier = std::make_shared<TaggedSliceVerifier>();

  SignerConfig no_key = TestConfig();
  no_key.signer_private_key.reset();
  ExpectThrow([&]() { SignerService service(storage, MakeChain(), verifier, no_key); },
              "Service needs a signer key");
  ExpectThrow([&]() { SignerService service(storage, nullptr, verifier, TestConfig()); },
              "Service needs a chain state");
  ExpectThrow([&]() { SignerService service(nullptr, MakeChain(), verifier, TestConfig()); },
              "Service needs storage");

  SignerConfig handed_over = TestConfig();
  SignerService service(storage, MakeChain(), verifier, std::move(handed_over));
  Expect(service.admission().ongoing() == 0, "Service built from a moved-in config");

  SignerConfig kept = TestConfig();
  dasigner::SecureZeroize(&kept.signer_private_key);
  Expect(!kept.signer_private_key.has_value(), "Wiped key is cleared");
  std::optional<Scalar> absent;
  dasigner::SecureZeroize(&absent);
  Expect(!absent.has_value(), "Wiping an absent key is a no-op");
}

void TestSignerConfig() {
  const std::string key_hex = "0x" + std::string(60, '0') + "beef";
  Expect(dasigner::ParseSignerPrivateKey(key_hex) == Scalar::FromUint64(0xbeef),
         "Key hex parses big-endian");
  ExpectThrow([]() { (void)dasigner::ParseSignerPrivateKey(std::string(64, '0')); },
              "Zero key is rejected");
  ExpectThrow([]() { (void)dasigner::ParseSignerPrivateKey("beef"); }, "Short key is rejected");
  ExpectThrow(
      []() {
        (void)dasigner::ParseSignerPrivateKey(
            dasigner::ToHex(dasigner::ExportBigEndian32(Scalar::ModulusR())));
      },
      "Key >= r is rejected");

  const char* defaults_argv[] = {"dasigner"};
  const SignerConfig defaults = dasigner::LoadSignerConfig(1, defaults_argv);
  Expect(!defaults.signer_private_key.has_value(), "Key is optional at parse time");
  Expect(defaults.max_ongoing_sign_request == 10, "Default admission cap is 10");
  Expect(!defaults.max_verify_threads.has_value(), "Verify threads default to hardware");
  Expect(defaults.max_slice_payload_len == dasigner::kDefaultMaxSlicePayloadLen,
         "Default slice payload limit");

  const std::filesystem::path config_path =
      std::filesystem::temp_directory_path() / "dasigner_signer_service_tests.ini";
  {
    std::ofstream file(config_path);
    file << "signer-private-key = " << key_hex << "\n"
         << "max-ongoing-sign-request = 4\n"
         << "max-verify-threads = 3\n"
         << "log-level = warn\n";
  }

  const std::string config_arg = config_path.string();
  const char* argv[] = {"dasigner", "--config", config_arg.c_str(),
                        "--max-ongoing-sign-request", "6"};
  const SignerConfig loaded = dasigner::LoadSignerConfig(5, argv);
  std::filesystem::remove(config_path);

  Expect(loaded.signer_private_key.has_value() &&
             *loaded.signer_private_key == Scalar::FromUint64(0xbeef),
         "Key is read from the config file");
  Expect(loaded.max_ongoing_sign_request == 6, "Command line wins over the config file");
  Expect(loaded.max_verify_threads == std::optional<size_t>(3), "Verify threads from file");
  Expect(loaded.log_level == spdlog::level::warn, "Log level from file");

  const char* zero_cap[] = {"dasigner", "--max-ongoing-sign-request", "0"};
  ExpectThrow([&]() { (void)dasigner::LoadSignerConfig(3, zero_cap); },
              "Zero admission cap is rejected");
  const char* bad_level[] = {"dasigner", "--log-level", "loud"};
  ExpectThrow([&]() { (void)dasigner::LoadSignerConfig(3, bad_level); },
              "Unknown log level is rejected");
}

}  // namespace

int main() {
  try {
    TestSignsAndPersistsBatch();
    TestEmptyBatch();
    TestBatchIsAllOrNothing();
    TestLifecycleAndAssignmentErrors();
    TestMalformedInputs();
    TestPersistenceFailure();
    TestPartialCommitIsKept();
    TestFailedCallFreesSingleSlot();
    TestAdmissionLimit();
    TestServiceConstruction();
    TestSignerConfig();
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << '\n';
    return 1;
  }

  std::cout << "Signer service tests passed" << '\n';
  return 0;
}
