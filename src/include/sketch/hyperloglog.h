//===----------------------------------------------------------------------===//
//
//                         HLL
//
// hyperloglog.h
//
// Identification: src/include/sketch/hyperloglog.h
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "sketch/hash_extractor.h"
#include "sketch/item.h"
#include "sketch/registers.h"

namespace hll {

/**
 * @brief General-purpose HyperLogLog sketch with precision in [8, 16].
 *
 * A HyperLogLog is a value: Add and Merge return a new sketch and never
 * modify the receiver. Registers are kept sparse, absent means 0.
 */
class HyperLogLog {
 public:
  /**
   * @param precision log2 of the number of registers
   * @throws InvalidPrecisionException if precision is outside [8, 16]
   */
  explicit HyperLogLog(int precision);

  /** @return a sketch that has also seen `item` */
  auto Add(const Item &item) const -> HyperLogLog;

  /** @return a sketch that has also seen every element of [first, last) */
  template <typename InputIt>
  auto AddAll(InputIt first, InputIt last) const -> HyperLogLog {
    HyperLogLog result(*this);
    const GenericHashExtractor extractor(precision_);
    for (; first != last; ++first) {
      auto update = extractor.Extract(Item(*first));
      UpdateRegister(&result.registers_, update.index_, update.value_);
    }
    return result;
  }

  /**
   * @brief Union of the given sketches.
   * @throws PrecisionMismatchException if the precisions differ
   * @throws Exception if the list is empty
   */
  static auto Merge(const std::vector<HyperLogLog> &sketches) -> HyperLogLog;

  /** @return the estimated number of distinct items added */
  auto Cardinality() const -> uint64_t;

  /** @return the sketch in the compact sparse or dense layout, whichever is smaller */
  auto Encode() const -> std::vector<uint8_t>;

  /** @throws MalformedInputException if `data` is not an encoded sketch */
  static auto Decode(const std::vector<uint8_t> &data) -> HyperLogLog;
  static auto Decode(std::string_view data) -> HyperLogLog;

  auto GetPrecision() const -> int16_t { return precision_; }
  auto GetRegisters() const -> const RegisterMap & { return registers_; }

  auto ToString() const -> std::string;

  auto operator==(const HyperLogLog &other) const -> bool {
    return precision_ == other.precision_ && registers_ == other.registers_;
  }
  auto operator!=(const HyperLogLog &other) const -> bool { return !(*this == other); }

 private:
  HyperLogLog(int16_t precision, RegisterMap registers);

  int16_t precision_;
  RegisterMap registers_;
};

}  // namespace hll

template <>
struct fmt::formatter<hll::HyperLogLog> : formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const hll::HyperLogLog &x, FormatContext &ctx) const {
    return formatter<std::string_view>::format(x.ToString(), ctx);
  }
};
