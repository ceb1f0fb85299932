#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "dasigner/common/bytes.hpp"

namespace dasigner {

constexpr size_t kDefaultMaxSlicePayloadLen = 64u << 20;

// One erasure-coded fragment of a blob. The payload carries the row data and
// the proof material; only an ISliceVerifier interprets it.
struct EncodedSlice {
  uint64_t index = 0;
  Bytes payload;

  bool operator==(const EncodedSlice& other) const = default;
};

// index (u64 big-endian) || payload_len (u32 big-endian) || payload
Bytes EncodeSlice(const EncodedSlice& slice);
// Throws std::invalid_argument on truncation, oversize payload or trailing
// bytes.
EncodedSlice DecodeSlice(std::span<const uint8_t> encoded,
                         size_t max_payload_len = kDefaultMaxSlicePayloadLen);

}  // namespace dasigner
