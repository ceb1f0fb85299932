#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace dasigner {

class IChainState {
 public:
  virtual ~IChainState() = default;

  // Number of quorums in `epoch`, looked up on chain when not known locally.
  // Throws when the epoch cannot be resolved.
  virtual uint64_t FetchQuorumCountIfMissing(uint64_t epoch) = 0;
};

// Caches per-epoch quorum counts in front of a (slow) chain lookup. Failed
// lookups are not cached and are retried on the next call.
class QuorumCountCache : public IChainState {
 public:
  using Fetcher = std::function<uint64_t(uint64_t epoch)>;

  explicit QuorumCountCache(Fetcher fetcher);

  uint64_t FetchQuorumCountIfMissing(uint64_t epoch) override;

  // Entries learned from chain synchronization.
  void Put(uint64_t epoch, uint64_t quorum_count);
  std::optional<uint64_t> Cached(uint64_t epoch) const;

 private:
  Fetcher fetcher_;
  mutable std::mutex mu_;
  std::unordered_map<uint64_t, uint64_t> quorum_counts_;
};

}  // namespace dasigner
