//===----------------------------------------------------------------------===//
//
//                         HLL
//
// sketch_codec.h
//
// Identification: src/include/sketch/sketch_codec.h
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "sketch/registers.h"

namespace hll {

/** Registers recovered from a serialized sketch. */
struct DecodedSketch {
  int16_t precision_;
  RegisterMap registers_;
};

/**
 * SketchCodec converts registers to and from one binary layout. Decode throws
 * MalformedInputException for buffers it does not recognize.
 */
class SketchCodec {
 public:
  virtual ~SketchCodec() = default;

  virtual auto Encode(int16_t precision, const RegisterMap &registers) const -> std::vector<uint8_t> = 0;

  virtual auto Decode(const uint8_t *data, size_t size) const -> DecodedSketch = 0;
};

/**
 * @brief Logs `reason` at WARN and throws it as a MalformedInputException.
 * Every decoder rejection goes through here.
 */
[[noreturn]] void RejectSketch(const std::string &reason);

}  // namespace hll
