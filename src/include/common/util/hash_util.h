//===----------------------------------------------------------------------===//
//
//                         HLL
//
// hash_util.h
//
// Identification: src/include/common/util/hash_util.h
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>

namespace hll {

using hash_t = uint64_t;

class HashUtil {
 public:
  /** @brief Spreads the bits of `x` over the whole word (splitmix64 finalizer). */
  static inline auto Mix64(uint64_t x) -> uint64_t {
    x ^= x >> 30;
    x *= 0xbf58476d1ce4e5b9ULL;
    x ^= x >> 27;
    x *= 0x94d049bb133111ebULL;
    x ^= x >> 31;
    return x;
  }

  /**
   * @brief Seeded FNV-1a over the bytes, finished with Mix64.
   *
   * Different seeds give unrelated hashes of the same bytes.
   */
  static inline auto HashBytes(const uint8_t *bytes, size_t length, uint64_t seed) -> hash_t {
    hash_t hash = FNV_OFFSET_BASIS ^ Mix64(seed + 0x9e3779b97f4a7c15ULL);
    for (size_t i = 0; i < length; ++i) {
      hash ^= bytes[i];
      hash *= FNV_PRIME;
    }
    return Mix64(hash ^ length);
  }

  /**
   * MurmurHash2, 64-bit version for 64-bit platforms, exactly as used by the
   * Redis HyperLogLog commands (PFADD, PFCOUNT, PFMERGE).
   */
  static inline auto MurmurHash64A(const uint8_t *data, size_t len, uint64_t seed) -> hash_t {
    constexpr uint64_t m = 0xc6a4a7935bd1e995ULL;
    constexpr int r = 47;
    uint64_t h = seed ^ (len * m);
    const uint8_t *end = data + (len - (len & 7));

    while (data != end) {
      uint64_t k = 0;
      for (int i = 7; i >= 0; i--) {
        k = (k << 8) | data[i];
      }

      k *= m;
      k ^= k >> r;
      k *= m;
      h ^= k;
      h *= m;
      data += 8;
    }

    switch (len & 7) {
      case 7:
        h ^= static_cast<uint64_t>(data[6]) << 48;
        [[fallthrough]];
      case 6:
        h ^= static_cast<uint64_t>(data[5]) << 40;
        [[fallthrough]];
      case 5:
        h ^= static_cast<uint64_t>(data[4]) << 32;
        [[fallthrough]];
      case 4:
        h ^= static_cast<uint64_t>(data[3]) << 24;
        [[fallthrough]];
      case 3:
        h ^= static_cast<uint64_t>(data[2]) << 16;
        [[fallthrough]];
      case 2:
        h ^= static_cast<uint64_t>(data[1]) << 8;
        [[fallthrough]];
      case 1:
        h ^= static_cast<uint64_t>(data[0]);
        h *= m;
    }

    h ^= h >> r;
    h *= m;
    h ^= h >> r;
    return h;
  }

 private:
  static constexpr hash_t FNV_OFFSET_BASIS = 14695981039346656037ULL;
  static constexpr hash_t FNV_PRIME = 1099511628211ULL;
};

}  // namespace hll
