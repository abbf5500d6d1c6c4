//===----------------------------------------------------------------------===//
//
//                         HLL
//
// hyperloglog.cpp
//
// Identification: src/sketch/hyperloglog.cpp
//
//===----------------------------------------------------------------------===//

#include "sketch/hyperloglog.h"

#include <utility>

#include "common/config.h"
#include "common/exception.h"
#include "sketch/estimator.h"
#include "sketch/generic_codec.h"

namespace hll {

namespace {

/** @return `precision` narrowed to int16_t, once it is known to be in range */
auto CheckedPrecision(int precision) -> int16_t {
  if (precision < HLL_MIN_PRECISION || precision > HLL_MAX_PRECISION) {
    throw InvalidPrecisionException(
        fmt::format("precision must be in [{}, {}], got {}", HLL_MIN_PRECISION, HLL_MAX_PRECISION, precision));
  }
  return static_cast<int16_t>(precision);
}

}  // namespace

HyperLogLog::HyperLogLog(int precision) : precision_(CheckedPrecision(precision)) {}

HyperLogLog::HyperLogLog(int16_t precision, RegisterMap registers)
    : precision_(precision), registers_(std::move(registers)) {}

/**
 * @brief Hashes `item` into one register update.
 * @return a copy of this sketch with the update applied, or this sketch when
 *         the register already holds at least that value
 */
auto HyperLogLog::Add(const Item &item) const -> HyperLogLog {
  auto update = GenericHashExtractor(precision_).Extract(item);
  if (!WouldUpdate(registers_, update.index_, update.value_)) {
    return *this;
  }
  HyperLogLog result(*this);
  UpdateRegister(&result.registers_, update.index_, update.value_);
  return result;
}

auto HyperLogLog::Merge(const std::vector<HyperLogLog> &sketches) -> HyperLogLog {
  if (sketches.empty()) {
    throw Exception(ExceptionType::INVALID, "cannot merge an empty list of sketches");
  }
  const int16_t precision = sketches.front().precision_;
  std::vector<const RegisterMap *> inputs;
  inputs.reserve(sketches.size());
  for (const auto &sketch : sketches) {
    if (sketch.precision_ != precision) {
      throw PrecisionMismatchException(
          fmt::format("cannot merge precision {} into precision {}", sketch.precision_, precision));
    }
    inputs.push_back(&sketch.registers_);
  }
  return {precision, MergeRegisters(inputs)};
}

auto HyperLogLog::Cardinality() const -> uint64_t { return CardinalityEstimator::Estimate(precision_, registers_); }

auto HyperLogLog::Encode() const -> std::vector<uint8_t> { return GenericCodec().Encode(precision_, registers_); }

auto HyperLogLog::Decode(const std::vector<uint8_t> &data) -> HyperLogLog {
  auto decoded = GenericCodec().Decode(data.data(), data.size());
  return {decoded.precision_, std::move(decoded.registers_)};
}

auto HyperLogLog::Decode(std::string_view data) -> HyperLogLog {
  auto decoded = GenericCodec().Decode(reinterpret_cast<const uint8_t *>(data.data()), data.size());
  return {decoded.precision_, std::move(decoded.registers_)};
}

auto HyperLogLog::ToString() const -> std::string {
  return fmt::format("HyperLogLog(precision={}, registers={})", precision_, registers_.size());
}

}  // namespace hll
