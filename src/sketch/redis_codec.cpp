//===----------------------------------------------------------------------===//
//
//                         HLL
//
// redis_codec.cpp
//
// Identification: src/sketch/redis_codec.cpp
//
//===----------------------------------------------------------------------===//

#include "sketch/redis_codec.h"

#include <algorithm>
#include <iterator>

#include <fmt/format.h>

#include "common/exception.h"
#include "common/logger.h"

namespace hll {

namespace {

constexpr uint8_t HLL_MAGIC[4] = {'H', 'Y', 'L', 'L'};
constexpr size_t HLL_ENCODING_OFFSET = 4;
constexpr size_t HLL_CARD_OFFSET = 8;
constexpr uint8_t HLL_CARD_STALE = 1 << 7;

constexpr uint8_t SPARSE_XZERO_BIT = 0x40;
constexpr uint8_t SPARSE_VAL_BIT = 0x80;

void AppendZeros(std::vector<uint8_t> *body, uint32_t len) {
  while (len > 0) {
    uint32_t run = std::min<uint32_t>(len, REDIS_HLL_SPARSE_XZERO_MAX_LEN);
    if (run > REDIS_HLL_SPARSE_ZERO_MAX_LEN) {
      body->push_back(static_cast<uint8_t>(SPARSE_XZERO_BIT | ((run - 1) >> 8)));
      body->push_back(static_cast<uint8_t>((run - 1) & 0xff));
    } else {
      body->push_back(static_cast<uint8_t>(run - 1));
    }
    len -= run;
  }
}

}  // namespace

auto RedisCodec::MakeHeader(uint8_t encoding) -> std::vector<uint8_t> {
  std::vector<uint8_t> header(REDIS_HLL_HDR_SIZE, 0);
  std::copy(std::begin(HLL_MAGIC), std::end(HLL_MAGIC), header.begin());
  header[HLL_ENCODING_OFFSET] = encoding;
  header[REDIS_HLL_HDR_SIZE - 1] = HLL_CARD_STALE;
  return header;
}

/**
 * @brief Opcode stream covering all 16384 registers.
 * @return the opcodes, or nullopt if a value does not fit a VAL opcode
 *
 * - ZERO:  00xxxxxx, 1 to 64 empty registers
 * - XZERO: 01xxxxxx xxxxxxxx, 1 to 16384 empty registers
 * - VAL:   1vvvvvxx, 1 to 4 registers holding value vvvvv + 1
 */
auto RedisCodec::EncodeSparseBody(const RegisterMap &registers) -> std::optional<std::vector<uint8_t>> {
  std::vector<uint8_t> body;
  int64_t prev = -1;
  auto it = registers.begin();
  while (it != registers.end()) {
    const uint32_t index = it->first;
    const uint8_t value = it->second;
    if (value > REDIS_HLL_SPARSE_VAL_MAX_VALUE) {
      return std::nullopt;
    }
    AppendZeros(&body, static_cast<uint32_t>(index - prev - 1));

    // Coalesce up to four adjacent registers with the same value.
    uint32_t len = 1;
    auto next = std::next(it);
    while (len < REDIS_HLL_SPARSE_VAL_MAX_LEN && next != registers.end() && next->first == index + len &&
           next->second == value) {
      ++len;
      ++next;
    }
    body.push_back(static_cast<uint8_t>(SPARSE_VAL_BIT | ((value - 1) << 2) | (len - 1)));
    prev = index + len - 1;
    it = next;
  }
  AppendZeros(&body, static_cast<uint32_t>(REDIS_HLL_REGISTERS - prev - 1));
  return body;
}

/**
 * @brief 6-bit registers packed LSB first, four registers per three bytes.
 */
auto RedisCodec::EncodeDenseBody(const RegisterMap &registers) -> std::vector<uint8_t> {
  std::vector<uint8_t> body(REDIS_HLL_DENSE_SIZE - REDIS_HLL_HDR_SIZE, 0);
  uint8_t r[4];
  auto it = registers.begin();
  for (uint32_t group = 0; group < REDIS_HLL_REGISTERS / 4; group++) {
    for (uint32_t j = 0; j < 4; j++) {
      r[j] = 0;
      if (it != registers.end() && it->first == group * 4 + j) {
        r[j] = it->second & HLL_REGISTER_MAX;
        ++it;
      }
    }
    uint8_t *b = &body[group * 3];
    b[0] = static_cast<uint8_t>(r[0] | (r[1] << 6));
    b[1] = static_cast<uint8_t>((r[1] >> 2) | (r[2] << 4));
    b[2] = static_cast<uint8_t>((r[2] >> 4) | (r[3] << 2));
  }
  return body;
}

auto RedisCodec::Encode(int16_t precision, const RegisterMap &registers) const -> std::vector<uint8_t> {
  if (precision != REDIS_HLL_P) {
    throw InvalidPrecisionException(
        fmt::format("redis sketches have precision {}, got {}", REDIS_HLL_P, precision));
  }
  auto sparse = EncodeSparseBody(registers);
  if (sparse.has_value() && REDIS_HLL_HDR_SIZE + sparse->size() <= options_.sparse_max_bytes_) {
    auto out = MakeHeader(REDIS_HLL_SPARSE);
    out.insert(out.end(), sparse->begin(), sparse->end());
    return out;
  }
  if (sparse.has_value()) {
    LOG_DEBUG("sparse encoding needs %zu bytes, limit is %zu, using dense", REDIS_HLL_HDR_SIZE + sparse->size(),
              options_.sparse_max_bytes_);
  } else {
    LOG_DEBUG("register value above %d, using dense", REDIS_HLL_SPARSE_VAL_MAX_VALUE);
  }
  auto out = MakeHeader(REDIS_HLL_DENSE);
  auto body = EncodeDenseBody(registers);
  out.insert(out.end(), body.begin(), body.end());
  return out;
}

void RedisCodec::CheckHeader(const uint8_t *data, size_t size) {
  if (size < REDIS_HLL_HDR_SIZE) {
    RejectSketch(fmt::format("{} bytes is shorter than the HYLL header", size));
  }
  if (!std::equal(std::begin(HLL_MAGIC), std::end(HLL_MAGIC), data)) {
    RejectSketch("missing HYLL magic");
  }
}

auto RedisCodec::Decode(const uint8_t *data, size_t size) const -> DecodedSketch {
  CheckHeader(data, size);
  const uint8_t *body = data + REDIS_HLL_HDR_SIZE;
  const size_t body_size = size - REDIS_HLL_HDR_SIZE;
  switch (data[HLL_ENCODING_OFFSET]) {
    case REDIS_HLL_SPARSE:
      return {REDIS_HLL_P, DecodeSparse(body, body_size)};
    case REDIS_HLL_DENSE:
      return {REDIS_HLL_P, DecodeDense(body, body_size)};
    default:
      RejectSketch(fmt::format("unknown HYLL encoding {}", data[HLL_ENCODING_OFFSET]));
  }
}

/**
 * @brief Expands an opcode stream back into registers.
 * @param body bytes after the HYLL header
 *
 * The opcodes must cover exactly 16384 registers and end with the body.
 */
auto RedisCodec::DecodeSparse(const uint8_t *body, size_t size) -> RegisterMap {
  RegisterMap registers;
  uint32_t index = 0;
  size_t pos = 0;
  while (pos < size) {
    const uint8_t op = body[pos];
    uint32_t runlen;
    if ((op & 0xc0) == 0) {
      runlen = (op & 0x3f) + 1;
      pos += 1;
    } else if ((op & 0xc0) == SPARSE_XZERO_BIT) {
      if (pos + 1 >= size) {
        RejectSketch("XZERO opcode cut short");
      }
      runlen = ((static_cast<uint32_t>(op & 0x3f) << 8) | body[pos + 1]) + 1;
      pos += 2;
    } else {
      runlen = (op & 0x3) + 1;
      const auto value = static_cast<uint8_t>(((op >> 2) & 0x1f) + 1);
      if (index + runlen > REDIS_HLL_REGISTERS) {
        break;
      }
      for (uint32_t i = 0; i < runlen; i++) {
        registers.emplace_hint(registers.end(), index + i, value);
      }
      pos += 1;
    }
    index += runlen;
    if (index > REDIS_HLL_REGISTERS) {
      break;
    }
  }
  if (index != REDIS_HLL_REGISTERS || pos != size) {
    RejectSketch(
        fmt::format("sparse opcodes cover {} registers, expected {}", index, REDIS_HLL_REGISTERS));
  }
  return registers;
}

auto RedisCodec::DecodeDense(const uint8_t *body, size_t size) -> RegisterMap {
  if (size != REDIS_HLL_DENSE_SIZE - REDIS_HLL_HDR_SIZE) {
    RejectSketch(
        fmt::format("dense body needs {} bytes, got {}", REDIS_HLL_DENSE_SIZE - REDIS_HLL_HDR_SIZE, size));
  }
  RegisterMap registers;
  for (uint32_t group = 0; group < REDIS_HLL_REGISTERS / 4; group++) {
    const uint8_t *b = &body[group * 3];
    const uint8_t r[4] = {
        static_cast<uint8_t>(b[0] & 0x3f),
        static_cast<uint8_t>((b[0] >> 6) | ((b[1] & 0x0f) << 2)),
        static_cast<uint8_t>((b[1] >> 4) | ((b[2] & 0x03) << 4)),
        static_cast<uint8_t>(b[2] >> 2),
    };
    for (uint32_t j = 0; j < 4; j++) {
      if (r[j] != 0) {
        registers.emplace_hint(registers.end(), group * 4 + j, r[j]);
      }
    }
  }
  return registers;
}

/**
 * @brief Reads the PFCOUNT cache in header bytes 8..15.
 * @return the little-endian cached count, or nullopt if the MSB of byte 15
 *         marks it stale
 */
auto RedisCodec::CachedCardinality(const uint8_t *data, size_t size) -> std::optional<uint64_t> {
  CheckHeader(data, size);
  const uint8_t *card = data + HLL_CARD_OFFSET;
  if ((card[7] & HLL_CARD_STALE) != 0) {
    return std::nullopt;
  }
  uint64_t value = 0;
  for (int i = 7; i >= 0; i--) {
    value = (value << 8) | card[i];
  }
  return value;
}

}  // namespace hll
