//===----------------------------------------------------------------------===//
//
//                         HLL
//
// config.h
//
// Identification: src/include/common/config.h
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>

namespace hll {

/** Smallest precision the general-purpose sketch accepts. */
static constexpr int16_t HLL_MIN_PRECISION = 8;
/** Largest precision the general-purpose sketch accepts. */
static constexpr int16_t HLL_MAX_PRECISION = 16;
/** Every register is stored in 6 bits by both serialization formats. */
static constexpr int HLL_REGISTER_BITS = 6;
static constexpr uint8_t HLL_REGISTER_MAX = (1 << HLL_REGISTER_BITS) - 1;

// Redis compatible sketch, see redis/src/hyperloglog.c
static constexpr int16_t REDIS_HLL_P = 14;
static constexpr uint32_t REDIS_HLL_REGISTERS = 1U << REDIS_HLL_P;
static constexpr uint32_t REDIS_HLL_P_MASK = REDIS_HLL_REGISTERS - 1;
static constexpr int REDIS_HLL_Q = 64 - REDIS_HLL_P;
static constexpr uint64_t REDIS_HLL_HASH_SEED = 0xadc83b19ULL;
static constexpr size_t REDIS_HLL_HDR_SIZE = 16;
static constexpr size_t REDIS_HLL_DENSE_SIZE = REDIS_HLL_HDR_SIZE + (REDIS_HLL_REGISTERS * HLL_REGISTER_BITS + 7) / 8;
static constexpr uint8_t REDIS_HLL_DENSE = 0;
static constexpr uint8_t REDIS_HLL_SPARSE = 1;
static constexpr int REDIS_HLL_SPARSE_VAL_MAX_VALUE = 32;
static constexpr int REDIS_HLL_SPARSE_VAL_MAX_LEN = 4;
static constexpr int REDIS_HLL_SPARSE_ZERO_MAX_LEN = 64;
static constexpr int REDIS_HLL_SPARSE_XZERO_MAX_LEN = 16384;
/** Default of the `hll-sparse-max-bytes` server option. */
static constexpr size_t REDIS_HLL_SPARSE_MAX_BYTES = 3000;

/** Runtime knobs of the Redis compatible encoder. */
struct RedisEncodeOptions {
  /** Largest sparse buffer (header included) emitted before switching to dense. */
  size_t sparse_max_bytes_{REDIS_HLL_SPARSE_MAX_BYTES};
};

}  // namespace hll
