#pragma once

#include <cstddef>

#include "dasigner/common/bytes.hpp"
#include "dasigner/crypto/scalar.hpp"

namespace dasigner {

class Csprng {
 public:
  static Bytes RandomBytes(size_t size);
  // Uniform in [1, r).
  static Scalar RandomNonZeroScalar();
};

}  // namespace dasigner
