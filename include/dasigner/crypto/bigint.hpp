#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

#include <gmpxx.h>

namespace dasigner {

mpz_class ImportBigEndian(std::span<const uint8_t> bytes);
mpz_class ImportLittleEndian(std::span<const uint8_t> bytes);

// Left-pads to 32 bytes. Throws std::invalid_argument if the value is negative
// or does not fit.
std::array<uint8_t, 32> ExportBigEndian32(const mpz_class& value);
std::array<uint8_t, 32> ExportLittleEndian32(const mpz_class& value);

}  // namespace dasigner
