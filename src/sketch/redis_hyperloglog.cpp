//===----------------------------------------------------------------------===//
//
//                         HLL
//
// redis_hyperloglog.cpp
//
// Identification: src/sketch/redis_hyperloglog.cpp
//
//===----------------------------------------------------------------------===//

#include "sketch/redis_hyperloglog.h"

#include "common/exception.h"
#include "sketch/estimator.h"
#include "sketch/redis_codec.h"

namespace hll {

auto RedisHyperLogLog::Add(const Item &item) const -> RedisHyperLogLog {
  auto update = RedisHashExtractor().Extract(item);
  if (!WouldUpdate(registers_, update.index_, update.value_)) {
    return *this;
  }
  RedisHyperLogLog result(*this);
  UpdateRegister(&result.registers_, update.index_, update.value_);
  return result;
}

/** @brief Same as PFMERGE: the register-wise maximum of every sketch. */
auto RedisHyperLogLog::Merge(const std::vector<RedisHyperLogLog> &sketches) -> RedisHyperLogLog {
  if (sketches.empty()) {
    throw Exception(ExceptionType::INVALID, "cannot merge an empty list of sketches");
  }
  std::vector<const RegisterMap *> inputs;
  inputs.reserve(sketches.size());
  for (const auto &sketch : sketches) {
    inputs.push_back(&sketch.registers_);
  }
  return RedisHyperLogLog(MergeRegisters(inputs));
}

auto RedisHyperLogLog::Cardinality() const -> uint64_t {
  return CardinalityEstimator::Estimate(REDIS_HLL_P, registers_);
}

auto RedisHyperLogLog::Encode(const RedisEncodeOptions &options) const -> std::vector<uint8_t> {
  return RedisCodec(options).Encode(REDIS_HLL_P, registers_);
}

auto RedisHyperLogLog::Decode(const std::vector<uint8_t> &data) -> RedisHyperLogLog {
  return RedisHyperLogLog(RedisCodec().Decode(data.data(), data.size()).registers_);
}

auto RedisHyperLogLog::Decode(std::string_view data) -> RedisHyperLogLog {
  auto decoded = RedisCodec().Decode(reinterpret_cast<const uint8_t *>(data.data()), data.size());
  return RedisHyperLogLog(std::move(decoded.registers_));
}

auto RedisHyperLogLog::ToString() const -> std::string {
  return fmt::format("RedisHyperLogLog(registers={})", registers_.size());
}

}  // namespace hll
