#pragma once

#include <gmpxx.h>

#include "dasigner/crypto/field_element.hpp"
#include "dasigner/crypto/scalar.hpp"

namespace dasigner {

// Affine point on the BN254 G1 curve y^2 = x^3 + 3.
class G1Point {
 public:
  // Point at infinity.
  G1Point();

  // Throws std::invalid_argument if (x, y) is not on the curve.
  static G1Point FromAffine(const FieldElement& x, const FieldElement& y);
  // No validation. Callers must run IsOnCurve/IsInPrimeSubgroup themselves.
  static G1Point FromAffineUnchecked(const FieldElement& x, const FieldElement& y);
  // Jacobian coordinates (X/Z^2, Y/Z^3); Z == 0 is the point at infinity.
  static G1Point FromJacobian(const FieldElement& x,
                              const FieldElement& y,
                              const FieldElement& z);

  static G1Point Generator();
  static G1Point GeneratorMultiply(const Scalar& scalar);

  bool IsInfinity() const;
  bool IsOnCurve() const;
  bool IsInPrimeSubgroup() const;

  G1Point Add(const G1Point& other) const;
  G1Point Double() const;
  G1Point Negate() const;
  G1Point Mul(const Scalar& scalar) const;

  const FieldElement& x() const;
  const FieldElement& y() const;

  bool operator==(const G1Point& other) const;
  bool operator!=(const G1Point& other) const;

 private:
  G1Point MulByInteger(const mpz_class& k) const;

  FieldElement x_;
  FieldElement y_;
  bool infinity_ = true;
};

}  // namespace dasigner
