#pragma once

#include <stdexcept>
#include <string>

#include "dasigner/common/status.hpp"

namespace dasigner {

enum class SignErrorKind {
  // Admission cap reached; transient.
  kOverloaded = 1,
  // Bad lengths, curve encodings or slice encodings.
  kMalformedInput = 2,
  // Supplied slices disagree with the quorum's assignment.
  kAssignmentMismatch = 3,
  // A slice failed its proof check against the commitment.
  kCryptographicFailure = 4,
  // Blob missing or already verified.
  kLifecycleViolation = 5,
  // Chain, storage or persistence failed; transient.
  kDependencyFailure = 6,
};

const char* SignErrorKindName(SignErrorKind kind);

class SignError : public std::runtime_error {
 public:
  SignError(SignErrorKind kind, const std::string& message);

  SignErrorKind kind() const;

 private:
  SignErrorKind kind_;
};

StatusCode ToStatusCode(SignErrorKind kind);

}  // namespace dasigner
