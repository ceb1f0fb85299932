#include "dasigner/crypto/scalar.hpp"

#include <stdexcept>

#include "dasigner/crypto/bigint.hpp"

namespace dasigner {
namespace {

const mpz_class kBn254Order(
    "21888242871839275222246405745257275088548364400416034343698204186575808495617");

mpz_class NormalizeToR(const mpz_class& input) {
  mpz_class normalized = input % kBn254Order;
  if (normalized < 0) {
    normalized += kBn254Order;
  }
  return normalized;
}

}  // namespace

Scalar::Scalar() : value_(0) {}

Scalar::Scalar(const mpz_class& value) : value_(NormalizeToR(value)) {}

Scalar Scalar::FromUint64(uint64_t value) {
  mpz_class v;
  mpz_import(v.get_mpz_t(), 1, 1, sizeof(value), 0, 0, &value);
  return Scalar(v);
}

Scalar Scalar::FromBigEndianModR(std::span<const uint8_t> bytes) {
  if (bytes.empty()) {
    throw std::invalid_argument("Big-endian input must not be empty");
  }
  return Scalar(ImportBigEndian(bytes));
}

Scalar Scalar::FromCanonicalBytes(std::span<const uint8_t> bytes) {
  if (bytes.size() != 32) {
    throw std::invalid_argument("Canonical scalar must be exactly 32 bytes");
  }

  mpz_class imported = ImportBigEndian(bytes);
  if (imported >= kBn254Order) {
    throw std::invalid_argument("Canonical scalar is out of range");
  }
  return Scalar(imported);
}

std::array<uint8_t, 32> Scalar::ToCanonicalBytes() const {
  return ExportBigEndian32(value_);
}

const mpz_class& Scalar::value() const {
  return value_;
}

bool Scalar::IsZero() const {
  return value_ == 0;
}

Scalar Scalar::operator+(const Scalar& other) const {
  return Scalar(value_ + other.value_);
}

Scalar Scalar::operator*(const Scalar& other) const {
  return Scalar(value_ * other.value_);
}

bool Scalar::operator==(const Scalar& other) const {
  return value_ == other.value_;
}

bool Scalar::operator!=(const Scalar& other) const {
  return !(*this == other);
}

const mpz_class& Scalar::ModulusR() {
  return kBn254Order;
}

}  // namespace dasigner
