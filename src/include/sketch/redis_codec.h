//===----------------------------------------------------------------------===//
//
//                         HLL
//
// redis_codec.h
//
// Identification: src/include/sketch/redis_codec.h
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "common/config.h"
#include "sketch/sketch_codec.h"

namespace hll {

/**
 * The string Redis stores under a HyperLogLog key.
 *
 * +------+---+-----+----------+
 * | HYLL | E | N/U | Cardin.  |
 * +------+---+-----+----------+
 *
 * A 4 byte magic, one encoding byte (0 dense, 1 sparse), three unused bytes
 * and an 8 byte little-endian cardinality cache whose most significant bit
 * marks it stale. Encode always emits a stale cache.
 *
 * Dense body: 16384 registers of 6 bits, least significant bit first, so
 * every 3 bytes hold 4 registers:
 *
 *   +--------+--------+--------+------//
 *   |11000000|22221111|33333322|55444444
 *   +--------+--------+--------+------//
 *
 * Sparse body: opcodes walking the registers in index order.
 *   ZERO:  00xxxxxx           xxxxxx+1 empty registers (1..64)
 *   XZERO: 01xxxxxx yyyyyyyy  14 bits + 1 empty registers (1..16384)
 *   VAL:   1vvvvvxx           xx+1 registers (1..4) holding vvvvv+1 (1..32)
 */
class RedisCodec : public SketchCodec {
 public:
  explicit RedisCodec(RedisEncodeOptions options = {}) : options_(options) {}

  auto Encode(int16_t precision, const RegisterMap &registers) const -> std::vector<uint8_t> override;
  auto Decode(const uint8_t *data, size_t size) const -> DecodedSketch override;

  /**
   * @brief Read the cardinality Redis cached in the header.
   * @return the cached value, or std::nullopt when the cache is stale
   * @throws MalformedInputException if the buffer has no valid header
   */
  static auto CachedCardinality(const uint8_t *data, size_t size) -> std::optional<uint64_t>;

  /** @return the sparse body, or std::nullopt if a register exceeds the VAL range */
  static auto EncodeSparseBody(const RegisterMap &registers) -> std::optional<std::vector<uint8_t>>;
  static auto EncodeDenseBody(const RegisterMap &registers) -> std::vector<uint8_t>;

 private:
  static void CheckHeader(const uint8_t *data, size_t size);
  static auto MakeHeader(uint8_t encoding) -> std::vector<uint8_t>;
  static auto DecodeSparse(const uint8_t *body, size_t size) -> RegisterMap;
  static auto DecodeDense(const uint8_t *body, size_t size) -> RegisterMap;

  RedisEncodeOptions options_;
};

}  // namespace hll
