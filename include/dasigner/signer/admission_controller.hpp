#pragma once

#include <cstdint>
#include <mutex>

namespace dasigner {

class AdmissionController;

// Held for the duration of one batch-sign call. Releases its slot when
// destroyed, whichever way the call exits.
class AdmissionPermit {
 public:
  AdmissionPermit(AdmissionPermit&& other) noexcept;
  ~AdmissionPermit();

  AdmissionPermit(const AdmissionPermit&) = delete;
  AdmissionPermit& operator=(const AdmissionPermit&) = delete;
  AdmissionPermit& operator=(AdmissionPermit&&) = delete;

 private:
  friend class AdmissionController;
  explicit AdmissionPermit(AdmissionController* owner);

  AdmissionController* owner_;
};

// Load-shedding gate over concurrent batch-sign calls. Callers beyond the cap
// are rejected at once, never queued.
class AdmissionController {
 public:
  static constexpr uint64_t kDefaultMaxOngoingSignRequest = 10;

  explicit AdmissionController(uint64_t max_ongoing = kDefaultMaxOngoingSignRequest);

  AdmissionController(const AdmissionController&) = delete;
  AdmissionController& operator=(const AdmissionController&) = delete;

  // Throws SignError(kOverloaded) when max_ongoing calls are already in flight.
  AdmissionPermit Enter();

  uint64_t ongoing() const;
  uint64_t max_ongoing() const;

 private:
  friend class AdmissionPermit;
  void Exit() noexcept;

  const uint64_t max_ongoing_;
  mutable std::mutex mu_;
  uint64_t ongoing_ = 0;
};

}  // namespace dasigner
