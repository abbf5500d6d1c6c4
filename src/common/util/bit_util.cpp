//===----------------------------------------------------------------------===//
//
//                         HLL
//
// bit_util.cpp
//
// Identification: src/common/util/bit_util.cpp
//
//===----------------------------------------------------------------------===//

#include "common/util/bit_util.h"

#include <utility>

#include "common/macros.h"

namespace hll {

/**
 * @brief Appends the low `width` bits of `value`, most significant first.
 */
void BitWriter::Append(uint32_t value, int width) {
  HLL_ASSERT(width >= 0 && width <= 32, "field width out of range");
  for (int i = width - 1; i >= 0; i--) {
    if ((bit_count_ & 7) == 0) {
      bytes_.push_back(0);
    }
    if (((value >> i) & 1U) != 0) {
      bytes_.back() |= static_cast<uint8_t>(0x80U >> (bit_count_ & 7));
    }
    bit_count_++;
  }
}

auto BitWriter::Finish() -> std::vector<uint8_t> {
  std::vector<uint8_t> out = std::move(bytes_);
  bytes_.clear();
  bit_count_ = 0;
  return out;
}

auto BitReader::Read(int width) -> uint32_t {
  HLL_ASSERT(width >= 0 && width <= 32, "field width out of range");
  HLL_ASSERT(static_cast<size_t>(width) <= Remaining(), "read past the end of the buffer");
  uint32_t value = 0;
  for (int i = 0; i < width; i++) {
    uint8_t byte = data_[bit_pos_ >> 3];
    value = (value << 1) | ((byte >> (7 - (bit_pos_ & 7))) & 1U);
    bit_pos_++;
  }
  return value;
}

}  // namespace hll
