#include "dasigner/crypto/field_element.hpp"

#include <stdexcept>

#include "dasigner/crypto/bigint.hpp"

namespace dasigner {
namespace {

const mpz_class kBn254FieldModulus(
    "21888242871839275222246405745257275088696311157297823662689037894645226208583");

mpz_class NormalizeToQ(const mpz_class& input) {
  mpz_class normalized = input % kBn254FieldModulus;
  if (normalized < 0) {
    normalized += kBn254FieldModulus;
  }
  return normalized;
}

}  // namespace

FieldElement::FieldElement() : value_(0) {}

FieldElement::FieldElement(const mpz_class& value) : value_(NormalizeToQ(value)) {}

FieldElement FieldElement::FromUint64(uint64_t value) {
  mpz_class v;
  mpz_import(v.get_mpz_t(), 1, 1, sizeof(value), 0, 0, &value);
  return FieldElement(v);
}

FieldElement FieldElement::FromBigEndianModQ(std::span<const uint8_t> bytes) {
  return FieldElement(ImportBigEndian(bytes));
}

FieldElement FieldElement::FromCanonicalLittleEndian(std::span<const uint8_t> bytes) {
  if (bytes.size() != 32) {
    throw std::invalid_argument("Field element must be exactly 32 bytes");
  }

  mpz_class imported = ImportLittleEndian(bytes);
  if (imported >= kBn254FieldModulus) {
    throw std::invalid_argument("Field element is not canonical (>= q)");
  }
  return FieldElement(imported);
}

std::array<uint8_t, 32> FieldElement::ToBigEndianBytes() const {
  return ExportBigEndian32(value_);
}

std::array<uint8_t, 32> FieldElement::ToLittleEndianBytes() const {
  return ExportLittleEndian32(value_);
}

const mpz_class& FieldElement::value() const {
  return value_;
}

bool FieldElement::IsZero() const {
  return value_ == 0;
}

FieldElement FieldElement::operator+(const FieldElement& other) const {
  return FieldElement(value_ + other.value_);
}

FieldElement FieldElement::operator-(const FieldElement& other) const {
  return FieldElement(value_ - other.value_);
}

FieldElement FieldElement::operator*(const FieldElement& other) const {
  return FieldElement(value_ * other.value_);
}

FieldElement FieldElement::operator-() const {
  return FieldElement(-value_);
}

FieldElement FieldElement::Square() const {
  return *this * *this;
}

FieldElement FieldElement::Pow(const mpz_class& exponent) const {
  if (exponent < 0) {
    throw std::invalid_argument("Field exponent must be non-negative");
  }
  mpz_class out;
  mpz_powm(out.get_mpz_t(), value_.get_mpz_t(), exponent.get_mpz_t(),
           kBn254FieldModulus.get_mpz_t());
  return FieldElement(out);
}

FieldElement FieldElement::Inverse() const {
  mpz_class out;
  if (value_ == 0 ||
      mpz_invert(out.get_mpz_t(), value_.get_mpz_t(), kBn254FieldModulus.get_mpz_t()) == 0) {
    throw std::domain_error("Zero has no inverse in Fq");
  }
  return FieldElement(out);
}

bool FieldElement::operator==(const FieldElement& other) const {
  return value_ == other.value_;
}

bool FieldElement::operator!=(const FieldElement& other) const {
  return !(*this == other);
}

const mpz_class& FieldElement::ModulusQ() {
  return kBn254FieldModulus;
}

}  // namespace dasigner
