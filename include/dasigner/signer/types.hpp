#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "dasigner/common/bytes.hpp"

namespace dasigner {

// Wire-level view of one request; fields are still undecoded.
struct SignRequest {
  uint64_t epoch = 0;
  uint64_t quorum_id = 0;
  Bytes storage_root;
  Bytes erasure_commitment;
  std::vector<Bytes> encoded_slice;
};

struct BatchSignRequest {
  std::vector<SignRequest> requests;
  // Remote address as reported by the transport; only logged.
  std::string peer;
};

struct BatchSignReply {
  // One uncompressed G1 signature per request, in request order.
  std::vector<Bytes> signatures;
};

}  // namespace dasigner
