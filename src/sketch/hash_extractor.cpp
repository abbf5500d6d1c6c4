//===----------------------------------------------------------------------===//
//
//                         HLL
//
// hash_extractor.cpp
//
// Identification: src/sketch/hash_extractor.cpp
//
//===----------------------------------------------------------------------===//

#include "sketch/hash_extractor.h"

#include <cstddef>
#include <vector>

#include "common/config.h"

namespace hll {

namespace {

// Marks the one-element wrapper the second hash is computed over.
constexpr uint8_t WRAPPER_TAG = 0x6c;

// High half of the 64-bit byte hash.
auto Hash32(const uint8_t *data, size_t size, uint32_t seed) -> uint32_t {
  return static_cast<uint32_t>(HashUtil::HashBytes(data, size, seed) >> 32);
}

}  // namespace

/**
 * @brief Leading zeros after the index bits, plus one.
 * @param hash   first hash, its top `precision` bits are the index
 * @param rehash second hash, only read when the suffix of `hash` is all zero
 * @return       a value in [1, 65 - precision]
 */
auto GenericHashExtractor::RunLength(int16_t precision, uint32_t hash, uint32_t rehash) -> uint8_t {
  const int suffix_bits = 32 - precision;
  uint32_t suffix = hash << precision;
  if (suffix != 0) {
    return static_cast<uint8_t>(__builtin_clz(suffix) + 1);
  }
  // 后缀全为 0，继续在第二个哈希里数前导零
  if (rehash != 0) {
    return static_cast<uint8_t>(suffix_bits + __builtin_clz(rehash) + 1);
  }
  return static_cast<uint8_t>(suffix_bits + 32 + 1);
}

auto GenericHashExtractor::Extract(const Item &item) const -> RegisterUpdate {
  const auto seed = static_cast<uint32_t>(item.GetKind());
  uint32_t hash = Hash32(item.GetData(), item.GetSize(), seed);
  auto index = static_cast<uint32_t>(hash >> (32 - precision_));

  uint32_t rehash = 0;
  if (static_cast<uint32_t>(hash << precision_) == 0) {
    std::vector<uint8_t> wrapped;
    wrapped.reserve(item.GetSize() + 2);
    wrapped.push_back(WRAPPER_TAG);
    wrapped.push_back(static_cast<uint8_t>(item.GetKind()));
    wrapped.insert(wrapped.end(), item.GetData(), item.GetData() + item.GetSize());
    rehash = Hash32(wrapped.data(), wrapped.size(), seed);
  }
  return {index, RunLength(precision_, hash, rehash)};
}

auto RedisHashExtractor::FromHash(hash_t hash) -> RegisterUpdate {
  auto index = static_cast<uint32_t>(hash & REDIS_HLL_P_MASK);
  hash >>= REDIS_HLL_P;
  if (hash == 0) {
    return {index, static_cast<uint8_t>(REDIS_HLL_Q + 1)};
  }
  return {index, static_cast<uint8_t>(__builtin_ctzll(hash) + 1)};
}

auto RedisHashExtractor::Extract(const Item &item) const -> RegisterUpdate {
  return FromHash(HashUtil::MurmurHash64A(item.GetData(), item.GetSize(), REDIS_HLL_HASH_SEED));
}

auto RedisHashExtractor::GetPrecision() const -> int16_t { return REDIS_HLL_P; }

}  // namespace hll
