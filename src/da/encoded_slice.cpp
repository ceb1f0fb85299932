#include "dasigner/da/encoded_slice.hpp"

#include <stdexcept>
#include <string>

namespace dasigner {
namespace {

void AppendU32Be(uint32_t value, Bytes* out) {
  for (int shift = 24; shift >= 0; shift -= 8) {
    out->push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
  }
}

void AppendU64Be(uint64_t value, Bytes* out) {
  for (int shift = 56; shift >= 0; shift -= 8) {
    out->push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
  }
}

uint64_t ReadBe(std::span<const uint8_t> input, size_t width, size_t* offset) {
  if (*offset + width > input.size()) {
    throw std::invalid_argument("Not enough bytes to read u" + std::to_string(width * 8));
  }

  uint64_t out = 0;
  for (size_t i = 0; i < width; ++i) {
    out = (out << 8) | input[*offset + i];
  }
  *offset += width;
  return out;
}

}  // namespace

Bytes EncodeSlice(const EncodedSlice& slice) {
  if (slice.payload.size() > UINT32_MAX) {
    throw std::invalid_argument("Slice payload exceeds uint32 length");
  }

  Bytes out;
  out.reserve(8 + 4 + slice.payload.size());
  AppendU64Be(slice.index, &out);
  AppendU32Be(static_cast<uint32_t>(slice.payload.size()), &out);
  out.insert(out.end(), slice.payload.begin(), slice.payload.end());
  return out;
}

EncodedSlice DecodeSlice(std::span<const uint8_t> encoded, size_t max_payload_len) {
  size_t offset = 0;

  EncodedSlice out;
  out.index = ReadBe(encoded, 8, &offset);

  const uint64_t len = ReadBe(encoded, 4, &offset);
  if (len > max_payload_len) {
    throw std::invalid_argument("Slice payload exceeds max length");
  }
  if (offset + len != encoded.size()) {
    throw std::invalid_argument(offset + len > encoded.size() ? "Slice payload is truncated"
                                                              : "Slice has trailing bytes");
  }

  out.payload.assign(encoded.begin() + static_cast<std::ptrdiff_t>(offset), encoded.end());
  return out;
}

}  // namespace dasigner
