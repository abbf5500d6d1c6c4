//===----------------------------------------------------------------------===//
//
//                         HLL
//
// estimator.cpp
//
// Identification: src/sketch/estimator.cpp
//
//===----------------------------------------------------------------------===//

#include "sketch/estimator.h"

#include <cmath>
#include <limits>
#include <unordered_map>

namespace hll {

namespace {

const double HLL_ALPHA_INF = 0.5 / std::log(2.0);

template <typename Histogram>
auto HistogramAt(const Histogram &histo, int k) -> double {
  auto it = histo.find(static_cast<uint8_t>(k));
  return it == histo.end() ? 0.0 : static_cast<double>(it->second);
}

}  // namespace

/**
 * @brief sigma(x) = x + sum_{k>=1} x^(2^k) * 2^(k-1)
 * @param x fraction of empty registers, in [0, 1]
 * @return  the correction term for zero registers, infinite at x = 1
 *
 * Sigma and Tau stop when an iteration no longer changes the accumulator.
 */
auto CardinalityEstimator::Sigma(double x) -> double {
  if (x == 1.0) {
    return INFINITY;
  }
  double y = 1;
  double z = x;
  double z_prime;
  do {
    x *= x;
    z_prime = z;
    z += x * y;
    y += y;
  } while (z_prime != z);
  return z;
}

/**
 * @brief tau(x) = (1 - x - sum_{k>=1} (1 - x^(2^-k))^2 * 2^-k) / 3
 * @param x fraction of registers below saturation, in [0, 1]
 */
auto CardinalityEstimator::Tau(double x) -> double {
  if (x == 0.0 || x == 1.0) {
    return 0.0;
  }
  double y = 1.0;
  double z = 1 - x;
  double z_prime;
  do {
    x = std::sqrt(x);
    z_prime = z;
    y *= 0.5;
    z -= (1 - x) * (1 - x) * y;
  } while (z_prime != z);
  return z / 3;
}

/**
 * @brief Improved raw estimator over a register histogram.
 * @param precision log2 of the register count m
 * @param nonempty  number of registers holding a value above 0
 * @param values    the values of those registers, in any order
 * @return          the rounded estimate, or UINT64_MAX when it overflows int64
 *
 * - q = 64 - precision, values q+1 are the saturated registers
 * - z 从 tau 项开始，向下逐级折半累加直方图，最后加上空寄存器的 sigma 项
 * - estimate = alpha_inf * m^2 / z
 */
auto CardinalityEstimator::Estimate(int16_t precision, size_t nonempty, const std::vector<uint8_t> &values)
    -> uint64_t {
  if (nonempty == 0) {
    return 0;
  }
  const int q = 64 - precision;
  const double m = static_cast<double>(1U << precision);

  std::unordered_map<uint8_t, uint64_t> histo;
  for (auto v : values) {
    histo[v]++;
  }

  double z = m * Tau(1 - HistogramAt(histo, q + 1) / m);
  for (int k = q; k >= 1; k--) {
    z = 0.5 * (z + HistogramAt(histo, k));
  }
  // nonempty > 0, so the argument of Sigma stays below 1
  z += m * Sigma(1 - static_cast<double>(nonempty) / m);

  const double estimate = HLL_ALPHA_INF * m * m / z;
  // z is 0 once every register is saturated
  if (!(estimate < static_cast<double>(std::numeric_limits<int64_t>::max()))) {
    return std::numeric_limits<uint64_t>::max();
  }
  return static_cast<uint64_t>(std::llround(estimate));
}

auto CardinalityEstimator::Estimate(int16_t precision, const RegisterMap &registers) -> uint64_t {
  std::vector<uint8_t> values;
  values.reserve(registers.size());
  for (const auto &entry : registers) {
    values.push_back(entry.second);
  }
  return Estimate(precision, registers.size(), values);
}

}  // namespace hll
