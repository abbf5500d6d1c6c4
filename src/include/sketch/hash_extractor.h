//===----------------------------------------------------------------------===//
//
//                         HLL
//
// hash_extractor.h
//
// Identification: src/include/sketch/hash_extractor.h
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

#include "common/util/hash_util.h"
#include "sketch/item.h"
#include "sketch/registers.h"

namespace hll {

/**
 * HashExtractor maps an item to the register it touches and the run length
 * it observes there.
 */
class HashExtractor {
 public:
  virtual ~HashExtractor() = default;

  /** @return the (bucket index, register value) pair for the item */
  virtual auto Extract(const Item &item) const -> RegisterUpdate = 0;

  /** @return log2 of the number of buckets indexed by Extract */
  virtual auto GetPrecision() const -> int16_t = 0;
};

/**
 * Hashing of the general-purpose sketch. The top `precision` bits of the high
 * half of HashUtil::HashBytes (seeded with the item kind) select the bucket,
 * the leading zeros of the rest give the run length. An all-zero suffix
 * continues the scan in a second hash taken over a one-element wrapper of the
 * item.
 */
class GenericHashExtractor : public HashExtractor {
 public:
  explicit GenericHashExtractor(int16_t precision) : precision_(precision) {}

  auto Extract(const Item &item) const -> RegisterUpdate override;
  auto GetPrecision() const -> int16_t override { return precision_; }

  /**
   * @brief Run length for a hash pair.
   * @param rehash only consulted when the suffix of `hash` is all zero
   * @return a value in [1, 65 - precision]
   */
  static auto RunLength(int16_t precision, uint32_t hash, uint32_t rehash) -> uint8_t;

 private:
  int16_t precision_;
};

/**
 * Hashing of Redis' PFADD: MurmurHash64A with seed 0xadc83b19, the low 14 bits
 * select the register and the trailing zeros of the upper 50 bits, plus one,
 * give its value. An all-zero upper part yields 51.
 */
class RedisHashExtractor : public HashExtractor {
 public:
  auto Extract(const Item &item) const -> RegisterUpdate override;
  auto GetPrecision() const -> int16_t override;

  static auto FromHash(hash_t hash) -> RegisterUpdate;
};

}  // namespace hll
