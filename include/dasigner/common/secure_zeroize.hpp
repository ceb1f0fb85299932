#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "dasigner/common/bytes.hpp"
#include "dasigner/crypto/scalar.hpp"

namespace dasigner {

inline void SecureZeroizeMemory(void* data, size_t size) noexcept {
  if (data == nullptr || size == 0) {
    return;
  }

  volatile uint8_t* ptr = static_cast<volatile uint8_t*>(data);
  while (size > 0) {
    *ptr = 0;
    ++ptr;
    --size;
  }
}

inline void SecureZeroize(Bytes* value) noexcept {
  if (value == nullptr) {
    return;
  }
  if (!value->empty()) {
    SecureZeroizeMemory(value->data(), value->size());
  }
  value->clear();
}

inline void SecureZeroize(std::string* value) noexcept {
  if (value == nullptr) {
    return;
  }
  if (!value->empty()) {
    SecureZeroizeMemory(value->data(), value->size());
  }
  value->clear();
}

// Overwrites the GMP limbs in place before resetting, so the key does not
// linger in freed memory.
inline void SecureZeroize(Scalar* value) noexcept {
  if (value == nullptr) {
    return;
  }
  mpz_ptr raw = const_cast<mpz_ptr>(value->value().get_mpz_t());
  const size_t limbs = mpz_size(raw);
  if (limbs > 0) {
    mp_limb_t* data = mpz_limbs_modify(raw, static_cast<mp_size_t>(limbs));
    SecureZeroizeMemory(data, limbs * sizeof(mp_limb_t));
    mpz_limbs_finish(raw, 0);
  }
  *value = Scalar();
}

inline void SecureZeroize(std::optional<Scalar>* value) noexcept {
  if (value == nullptr) {
    return;
  }
  if (value->has_value()) {
    SecureZeroize(&value->value());
  }
  value->reset();
}

}  // namespace dasigner
