//===----------------------------------------------------------------------===//
//
//                         HLL
//
// estimator.h
//
// Identification: src/include/sketch/estimator.h
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "sketch/registers.h"

namespace hll {

/**
 * Cardinality estimation from register values, Algorithm 6 of Otmar Ertl,
 * "New cardinality estimation algorithms for HyperLogLog sketches" (2017).
 * Redis (>= 5) uses the same estimator, so results match PFCOUNT.
 */
class CardinalityEstimator {
 public:
  /**
   * @param precision log2 of the register count
   * @param nonempty number of registers holding a non-zero value
   * @param values the value of every non-empty register
   * @return the rounded estimate, 0 when no register is set
   */
  static auto Estimate(int16_t precision, size_t nonempty, const std::vector<uint8_t> &values) -> uint64_t;

  static auto Estimate(int16_t precision, const RegisterMap &registers) -> uint64_t;

  static auto Sigma(double x) -> double;
  static auto Tau(double x) -> double;
};

}  // namespace hll
