//===----------------------------------------------------------------------===//
//
//                         HLL
//
// generic_codec.h
//
// Identification: src/include/sketch/generic_codec.h
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "sketch/sketch_codec.h"

namespace hll {

/**
 * Binary format of the general-purpose sketch.
 *
 *   sparse: <<0:4, p-8:4, (index:p, value:6)*, zero padding to a byte>>
 *   dense:  <<1:4, p-8:4, value_0:6, value_1:6, ... value_{2^p-1}:6>>
 *
 * Fields are packed most significant bit first. Sparse records are in
 * ascending index order and the decoder discards a tail shorter than one
 * record. The encoder picks whichever body is smaller.
 */
class GenericCodec : public SketchCodec {
 public:
  static constexpr uint8_t FORMAT_SPARSE = 0;
  static constexpr uint8_t FORMAT_DENSE = 1;

  auto Encode(int16_t precision, const RegisterMap &registers) const -> std::vector<uint8_t> override;
  auto Decode(const uint8_t *data, size_t size) const -> DecodedSketch override;

  /** @return true if `count` sparse records are strictly smaller than the dense body */
  static auto PreferSparse(int16_t precision, size_t count) -> bool;

 private:
  static auto DecodeSparse(int16_t precision, const uint8_t *body, size_t size) -> RegisterMap;
  static auto DecodeDense(int16_t precision, const uint8_t *body, size_t size) -> RegisterMap;
};

}  // namespace hll
