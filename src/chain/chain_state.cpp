#include "dasigner/chain/chain_state.hpp"

#include <stdexcept>
#include <utility>

namespace dasigner {

QuorumCountCache::QuorumCountCache(Fetcher fetcher) : fetcher_(std::move(fetcher)) {
  if (!fetcher_) {
    throw std::invalid_argument("QuorumCountCache requires a fetcher");
  }
}

uint64_t QuorumCountCache::FetchQuorumCountIfMissing(uint64_t epoch) {
  if (const std::optional<uint64_t> cached = Cached(epoch); cached.has_value()) {
    return *cached;
  }

  // The lock is not held across the lookup; concurrent misses may fetch the
  // same epoch twice and agree on the result.
  const uint64_t quorum_count = fetcher_(epoch);
  Put(epoch, quorum_count);
  return quorum_count;
}

void QuorumCountCache::Put(uint64_t epoch, uint64_t quorum_count) {
  std::lock_guard<std::mutex> lock(mu_);
  quorum_counts_[epoch] = quorum_count;
}

std::optional<uint64_t> QuorumCountCache::Cached(uint64_t epoch) const {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = quorum_counts_.find(epoch);
  if (it == quorum_counts_.end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace dasigner
