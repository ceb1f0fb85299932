#include "dasigner/crypto/random.hpp"

#include <stdexcept>

#include <openssl/rand.h>

namespace dasigner {

Bytes Csprng::RandomBytes(size_t size) {
  Bytes out(size);
  if (size == 0) {
    return out;
  }

  if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
  return out;
}

Scalar Csprng::RandomNonZeroScalar() {
  while (true) {
    Bytes bytes = RandomBytes(32);
    // r is a 254-bit prime; dropping the top two bits keeps rejection rare.
    bytes[0] &= 0x3F;
    try {
      const Scalar candidate = Scalar::FromCanonicalBytes(bytes);
      if (!candidate.IsZero()) {
        return candidate;
      }
    } catch (const std::invalid_argument&) {
      continue;
    }
  }
}

}  // namespace dasigner
