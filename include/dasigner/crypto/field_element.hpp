#pragma once

#include <array>
#include <cstdint>
#include <span>

#include <gmpxx.h>

namespace dasigner {

// Element of the BN254 base field Fq, always kept reduced to [0, q).
class FieldElement {
 public:
  FieldElement();
  explicit FieldElement(const mpz_class& value);

  static FieldElement FromUint64(uint64_t value);
  static FieldElement FromBigEndianModQ(std::span<const uint8_t> bytes);

  // Exactly 32 bytes, value must be < q. Throws std::invalid_argument.
  static FieldElement FromCanonicalLittleEndian(std::span<const uint8_t> bytes);

  std::array<uint8_t, 32> ToBigEndianBytes() const;
  std::array<uint8_t, 32> ToLittleEndianBytes() const;

  const mpz_class& value() const;
  bool IsZero() const;

  FieldElement operator+(const FieldElement& other) const;
  FieldElement operator-(const FieldElement& other) const;
  FieldElement operator*(const FieldElement& other) const;
  FieldElement operator-() const;

  FieldElement Square() const;
  FieldElement Pow(const mpz_class& exponent) const;
  // Throws std::domain_error for zero.
  FieldElement Inverse() const;

  bool operator==(const FieldElement& other) const;
  bool operator!=(const FieldElement& other) const;

  static const mpz_class& ModulusQ();

 private:
  mpz_class value_;
};

}  // namespace dasigner
