#include "dasigner/crypto/bigint.hpp"

#include <algorithm>
#include <stdexcept>

namespace dasigner {

mpz_class ImportBigEndian(std::span<const uint8_t> bytes) {
  mpz_class out;
  if (!bytes.empty()) {
    mpz_import(out.get_mpz_t(), bytes.size(), 1, sizeof(uint8_t), 1, 0, bytes.data());
  }
  return out;
}

mpz_class ImportLittleEndian(std::span<const uint8_t> bytes) {
  mpz_class out;
  if (!bytes.empty()) {
    mpz_import(out.get_mpz_t(), bytes.size(), -1, sizeof(uint8_t), 1, 0, bytes.data());
  }
  return out;
}

std::array<uint8_t, 32> ExportBigEndian32(const mpz_class& value) {
  if (value < 0) {
    throw std::invalid_argument("Cannot export a negative integer");
  }

  std::array<uint8_t, 32> out{};
  if (value == 0) {
    return out;
  }
  if (mpz_sizeinbase(value.get_mpz_t(), 2) > 256) {
    throw std::invalid_argument("Integer is larger than 32 bytes");
  }

  size_t count = 0;
  mpz_export(out.data(), &count, 1, sizeof(uint8_t), 1, 0, value.get_mpz_t());

  const size_t offset = out.size() - count;
  std::rotate(out.begin(), out.begin() + count, out.end());
  std::fill(out.begin(), out.begin() + offset, 0);
  return out;
}

std::array<uint8_t, 32> ExportLittleEndian32(const mpz_class& value) {
  std::array<uint8_t, 32> out = ExportBigEndian32(value);
  std::reverse(out.begin(), out.end());
  return out;
}

}  // namespace dasigner
