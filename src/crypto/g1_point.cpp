#include "dasigner/crypto/g1_point.hpp"

#include <stdexcept>

namespace dasigner {
namespace {

const FieldElement& CurveB() {
  static const FieldElement kB = FieldElement::FromUint64(3);
  return kB;
}

}  // namespace

G1Point::G1Point() = default;

G1Point G1Point::FromAffine(const FieldElement& x, const FieldElement& y) {
  G1Point out = FromAffineUnchecked(x, y);
  if (!out.IsOnCurve()) {
    throw std::invalid_argument("Affine coordinates are not on the BN254 G1 curve");
  }
  return out;
}

G1Point G1Point::FromAffineUnchecked(const FieldElement& x, const FieldElement& y) {
  G1Point out;
  out.x_ = x;
  out.y_ = y;
  out.infinity_ = false;
  return out;
}

G1Point G1Point::FromJacobian(const FieldElement& x,
                              const FieldElement& y,
                              const FieldElement& z) {
  if (z.IsZero()) {
    return G1Point();
  }

  const FieldElement z_inv = z.Inverse();
  const FieldElement z_inv2 = z_inv.Square();
  const FieldElement z_inv3 = z_inv2 * z_inv;
  return FromAffine(x * z_inv2, y * z_inv3);
}

G1Point G1Point::Generator() {
  return FromAffineUnchecked(FieldElement::FromUint64(1), FieldElement::FromUint64(2));
}

G1Point G1Point::GeneratorMultiply(const Scalar& scalar) {
  return Generator().Mul(scalar);
}

bool G1Point::IsInfinity() const {
  return infinity_;
}

bool G1Point::IsOnCurve() const {
  if (infinity_) {
    return true;
  }
  return y_.Square() == x_.Square() * x_ + CurveB();
}

bool G1Point::IsInPrimeSubgroup() const {
  return MulByInteger(Scalar::ModulusR()).IsInfinity();
}

G1Point G1Point::Add(const G1Point& other) const {
  if (infinity_) {
    return other;
  }
  if (other.infinity_) {
    return *this;
  }

  if (x_ == other.x_) {
    if ((y_ + other.y_).IsZero()) {
      return G1Point();
    }
    return Double();
  }

  const FieldElement lambda = (other.y_ - y_) * (other.x_ - x_).Inverse();
  const FieldElement x3 = lambda.Square() - x_ - other.x_;
  const FieldElement y3 = lambda * (x_ - x3) - y_;
  return FromAffineUnchecked(x3, y3);
}

G1Point G1Point::Double() const {
  if (infinity_ || y_.IsZero()) {
    return G1Point();
  }

  const FieldElement three = FieldElement::FromUint64(3);
  const FieldElement lambda = three * x_.Square() * (y_ + y_).Inverse();
  const FieldElement x3 = lambda.Square() - x_ - x_;
  const FieldElement y3 = lambda * (x_ - x3) - y_;
  return FromAffineUnchecked(x3, y3);
}

G1Point G1Point::Negate() const {
  if (infinity_) {
    return *this;
  }
  return FromAffineUnchecked(x_, -y_);
}

G1Point G1Point::Mul(const Scalar& scalar) const {
  return MulByInteger(scalar.value());
}

G1Point G1Point::MulByInteger(const mpz_class& k) const {
  if (k < 0) {
    throw std::invalid_argument("Scalar multiplier must be non-negative");
  }

  G1Point acc;
  if (k == 0 || infinity_) {
    return acc;
  }

  const size_t bits = mpz_sizeinbase(k.get_mpz_t(), 2);
  for (size_t i = bits; i-- > 0;) {
    acc = acc.Double();
    if (mpz_tstbit(k.get_mpz_t(), i) != 0) {
      acc = acc.Add(*this);
    }
  }
  return acc;
}

const FieldElement& G1Point::x() const {
  return x_;
}

const FieldElement& G1Point::y() const {
  return y_;
}

bool G1Point::operator==(const G1Point& other) const {
  if (infinity_ || other.infinity_) {
    return infinity_ == other.infinity_;
  }
  return x_ == other.x_ && y_ == other.y_;
}

bool G1Point::operator!=(const G1Point& other) const {
  return !(*this == other);
}

}  // namespace dasigner
