#include "dasigner/crypto/hash.hpp"

#include <array>
#include <cstddef>
#include <cstdint>

namespace dasigner {
namespace {

constexpr size_t kKeccak256Rate = 136;

constexpr std::array<uint64_t, 24> kRoundConstants = {
    0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808AULL,
    0x8000000080008000ULL, 0x000000000000808BULL, 0x0000000080000001ULL,
    0x8000000080008081ULL, 0x8000000000008009ULL, 0x000000000000008AULL,
    0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000AULL,
    0x000000008000808BULL, 0x800000000000008BULL, 0x8000000000008089ULL,
    0x8000000000008003ULL, 0x8000000000008002ULL, 0x8000000000000080ULL,
    0x000000000000800AULL, 0x800000008000000AULL, 0x8000000080008081ULL,
    0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL};

// Rotation offsets and pi-step lane order, walking the lanes starting at (1, 0).
constexpr std::array<unsigned, 24> kRotations = {
    1, 3, 6, 10, 15, 21, 28, 36, 45, 55, 2, 14, 27, 41, 56, 8, 25, 43, 62, 18, 39, 61, 20, 44};
constexpr std::array<size_t, 24> kPiLanes = {
    10, 7, 11, 17, 18, 3, 5, 16, 8, 21, 24, 4, 15, 23, 19, 13, 12, 2, 20, 14, 22, 9, 6, 1};

uint64_t RotateLeft(uint64_t value, unsigned shift) {
  return (value << shift) | (value >> (64 - shift));
}

void KeccakF1600(std::array<uint64_t, 25>* state) {
  std::array<uint64_t, 25>& s = *state;
  for (uint64_t round_constant : kRoundConstants) {
    // theta
    std::array<uint64_t, 5> c{};
    for (size_t x = 0; x < 5; ++x) {
      c[x] = s[x] ^ s[x + 5] ^ s[x + 10] ^ s[x + 15] ^ s[x + 20];
    }
    for (size_t x = 0; x < 5; ++x) {
      const uint64_t d = c[(x + 4) % 5] ^ RotateLeft(c[(x + 1) % 5], 1);
      for (size_t y = 0; y < 25; y += 5) {
        s[y + x] ^= d;
      }
    }

    // rho and pi
    uint64_t carry = s[1];
    for (size_t i = 0; i < 24; ++i) {
      const size_t lane = kPiLanes[i];
      const uint64_t next = s[lane];
      s[lane] = RotateLeft(carry, kRotations[i]);
      carry = next;
    }

    // chi
    for (size_t y = 0; y < 25; y += 5) {
      std::array<uint64_t, 5> row{};
      for (size_t x = 0; x < 5; ++x) {
        row[x] = s[y + x];
      }
      for (size_t x = 0; x < 5; ++x) {
        s[y + x] = row[x] ^ ((~row[(x + 1) % 5]) & row[(x + 2) % 5]);
      }
    }

    // iota
    s[0] ^= round_constant;
  }
}

void AbsorbBlock(const uint8_t* block, std::array<uint64_t, 25>* state) {
  for (size_t lane = 0; lane < kKeccak256Rate / 8; ++lane) {
    uint64_t word = 0;
    for (size_t b = 0; b < 8; ++b) {
      word |= static_cast<uint64_t>(block[lane * 8 + b]) << (8 * b);
    }
    (*state)[lane] ^= word;
  }
  KeccakF1600(state);
}

}  // namespace

Bytes32 Keccak256(std::span<const uint8_t> data) {
  std::array<uint64_t, 25> state{};

  size_t offset = 0;
  while (data.size() - offset >= kKeccak256Rate) {
    AbsorbBlock(data.data() + offset, &state);
    offset += kKeccak256Rate;
  }

  std::array<uint8_t, kKeccak256Rate> last{};
  const size_t remaining = data.size() - offset;
  for (size_t i = 0; i < remaining; ++i) {
    last[i] = data[offset + i];
  }
  last[remaining] ^= 0x01;
  last[kKeccak256Rate - 1] ^= 0x80;
  AbsorbBlock(last.data(), &state);

  Bytes32 out{};
  for (size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(state[i / 8] >> (8 * (i % 8)));
  }
  return out;
}

}  // namespace dasigner
