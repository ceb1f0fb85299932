#include "dasigner/signer/errors.hpp"

namespace dasigner {

const char* SignErrorKindName(SignErrorKind kind) {
  switch (kind) {
    case SignErrorKind::kOverloaded:
      return "overloaded";
    case SignErrorKind::kMalformedInput:
      return "malformed input";
    case SignErrorKind::kAssignmentMismatch:
      return "assignment mismatch";
    case SignErrorKind::kCryptographicFailure:
      return "cryptographic failure";
    case SignErrorKind::kLifecycleViolation:
      return "lifecycle violation";
    case SignErrorKind::kDependencyFailure:
      return "dependency failure";
  }
  return "unknown";
}

SignError::SignError(SignErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

SignErrorKind SignError::kind() const {
  return kind_;
}

StatusCode ToStatusCode(SignErrorKind kind) {
  switch (kind) {
    case SignErrorKind::kOverloaded:
      return StatusCode::kResourceExhausted;
    case SignErrorKind::kMalformedInput:
    case SignErrorKind::kAssignmentMismatch:
    case SignErrorKind::kCryptographicFailure:
      return StatusCode::kInvalidArgument;
    case SignErrorKind::kLifecycleViolation:
    case SignErrorKind::kDependencyFailure:
      return StatusCode::kInternal;
  }
  return StatusCode::kInternal;
}

}  // namespace dasigner
