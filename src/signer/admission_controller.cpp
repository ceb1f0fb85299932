#include "dasigner/signer/admission_controller.hpp"

#include <stdexcept>

#include "dasigner/common/logger.hpp"
#include "dasigner/signer/errors.hpp"

namespace dasigner {

AdmissionPermit::AdmissionPermit(AdmissionController* owner) : owner_(owner) {}

AdmissionPermit::AdmissionPermit(AdmissionPermit&& other) noexcept : owner_(other.owner_) {
  other.owner_ = nullptr;
}

AdmissionPermit::~AdmissionPermit() {
  if (owner_ != nullptr) {
    owner_->Exit();
  }
}

AdmissionController::AdmissionController(uint64_t max_ongoing) : max_ongoing_(max_ongoing) {
  if (max_ongoing_ == 0) {
    throw std::invalid_argument("max ongoing sign requests must be > 0");
  }
}

AdmissionPermit AdmissionController::Enter() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (ongoing_ < max_ongoing_) {
      ++ongoing_;
      return AdmissionPermit(this);
    }
  }

  static Logger logger = CreateLogger("admission");
  logger->warn("rejecting batch sign call, {} calls already in flight", max_ongoing_);
  throw SignError(SignErrorKind::kOverloaded, "request pool is full");
}

uint64_t AdmissionController::ongoing() const {
  std::lock_guard<std::mutex> lock(mu_);
  return ongoing_;
}

uint64_t AdmissionController::max_ongoing() const {
  return max_ongoing_;
}

void AdmissionController::Exit() noexcept {
  std::lock_guard<std::mutex> lock(mu_);
  if (ongoing_ > 0) {
    --ongoing_;
  }
}

}  // namespace dasigner
