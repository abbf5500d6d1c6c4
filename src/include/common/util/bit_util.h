//===----------------------------------------------------------------------===//
//
//                         HLL
//
// bit_util.h
//
// Identification: src/include/common/util/bit_util.h
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace hll {

/**
 * BitWriter appends fixed-width unsigned fields most significant bit first,
 * the same order a bit string literal is read in.
 */
class BitWriter {
 public:
  BitWriter() = default;

  /** @brief Append the low `width` bits of `value`, width in [0, 32]. */
  void Append(uint32_t value, int width);

  /** @return number of bits appended so far */
  auto BitCount() const -> size_t { return bit_count_; }

  /**
   * @brief Zero-fill up to the next byte boundary and hand the bytes over.
   * @return the packed buffer; the writer is empty afterwards
   */
  auto Finish() -> std::vector<uint8_t>;

 private:
  std::vector<uint8_t> bytes_;
  size_t bit_count_{0};
};

/** BitReader is the inverse of BitWriter over a borrowed buffer. */
class BitReader {
 public:
  BitReader(const uint8_t *data, size_t size) : data_(data), bit_size_(size * 8) {}

  /** @return bits not consumed yet */
  auto Remaining() const -> size_t { return bit_size_ - bit_pos_; }

  /** @brief Consume `width` bits, width in [0, 32] and not more than Remaining(). */
  auto Read(int width) -> uint32_t;

 private:
  const uint8_t *data_;
  size_t bit_size_;
  size_t bit_pos_{0};
};

}  // namespace hll
