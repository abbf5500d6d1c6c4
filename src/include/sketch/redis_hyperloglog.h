//===----------------------------------------------------------------------===//
//
//                         HLL
//
// redis_hyperloglog.h
//
// Identification: src/include/sketch/redis_hyperloglog.h
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "common/config.h"
#include "sketch/hash_extractor.h"
#include "sketch/item.h"
#include "sketch/registers.h"

namespace hll {

/**
 * @brief HyperLogLog interchangeable with Redis' PFADD / PFCOUNT / GET.
 *
 * Precision is fixed at 14. Hash, estimator and the string layout are the
 * ones Redis uses, so an encoded sketch can be SET under a key and counted by
 * PFCOUNT, and the value of GET can be decoded here.
 */
class RedisHyperLogLog {
 public:
  RedisHyperLogLog() = default;

  auto Add(const Item &item) const -> RedisHyperLogLog;

  template <typename InputIt>
  auto AddAll(InputIt first, InputIt last) const -> RedisHyperLogLog {
    RedisHyperLogLog result(*this);
    const RedisHashExtractor extractor;
    for (; first != last; ++first) {
      auto update = extractor.Extract(Item(*first));
      UpdateRegister(&result.registers_, update.index_, update.value_);
    }
    return result;
  }

  /** @throws Exception if the list is empty */
  static auto Merge(const std::vector<RedisHyperLogLog> &sketches) -> RedisHyperLogLog;

  /** @return the same number PFCOUNT reports for this sketch */
  auto Cardinality() const -> uint64_t;

  auto Encode(const RedisEncodeOptions &options = {}) const -> std::vector<uint8_t>;

  static auto Decode(const std::vector<uint8_t> &data) -> RedisHyperLogLog;
  static auto Decode(std::string_view data) -> RedisHyperLogLog;

  auto GetPrecision() const -> int16_t { return REDIS_HLL_P; }
  auto GetRegisters() const -> const RegisterMap & { return registers_; }

  auto ToString() const -> std::string;

  auto operator==(const RedisHyperLogLog &other) const -> bool { return registers_ == other.registers_; }
  auto operator!=(const RedisHyperLogLog &other) const -> bool { return !(*this == other); }

 private:
  explicit RedisHyperLogLog(RegisterMap registers) : registers_(std::move(registers)) {}

  RegisterMap registers_;
};

}  // namespace hll

template <>
struct fmt::formatter<hll::RedisHyperLogLog> : formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const hll::RedisHyperLogLog &x, FormatContext &ctx) const {
    return formatter<std::string_view>::format(x.ToString(), ctx);
  }
};
