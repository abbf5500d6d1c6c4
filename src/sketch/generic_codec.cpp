//===----------------------------------------------------------------------===//
//
//                         HLL
//
// generic_codec.cpp
//
// Identification: src/sketch/generic_codec.cpp
//
//===----------------------------------------------------------------------===//

#include "sketch/generic_codec.h"

#include <fmt/format.h>

#include "common/config.h"
#include "common/util/bit_util.h"

namespace hll {

auto GenericCodec::PreferSparse(int16_t precision, size_t count) -> bool {
  return static_cast<size_t>(precision + HLL_REGISTER_BITS) * count <
         static_cast<size_t>(HLL_REGISTER_BITS) * (size_t{1} << precision);
}

/**
 * @brief Packs the registers MSB first behind a one byte header.
 * @return header (format << 4 | precision - 8), then either (index, value)
 *         records of precision + 6 bits or all 2^precision registers at 6 bits
 */
auto GenericCodec::Encode(int16_t precision, const RegisterMap &registers) const -> std::vector<uint8_t> {
  BitWriter writer;
  const auto precision_code = static_cast<uint32_t>(precision - HLL_MIN_PRECISION);

  if (PreferSparse(precision, registers.size())) {
    writer.Append(FORMAT_SPARSE, 4);
    writer.Append(precision_code, 4);
    for (const auto &[index, value] : registers) {
      writer.Append(index, precision);
      writer.Append(value, HLL_REGISTER_BITS);
    }
    // Finish() pads with 0-7 zero bits, always shorter than a record
    return writer.Finish();
  }

  writer.Append(FORMAT_DENSE, 4);
  writer.Append(precision_code, 4);
  const uint32_t m = 1U << precision;
  auto it = registers.begin();
  for (uint32_t i = 0; i < m; i++) {
    uint8_t value = 0;
    if (it != registers.end() && it->first == i) {
      value = it->second;
      ++it;
    }
    writer.Append(value, HLL_REGISTER_BITS);
  }
  return writer.Finish();
}

auto GenericCodec::Decode(const uint8_t *data, size_t size) const -> DecodedSketch {
  if (size == 0) {
    RejectSketch("empty buffer is not a sketch");
  }
  const uint8_t format = data[0] >> 4;
  const int16_t precision = HLL_MIN_PRECISION + (data[0] & 0x0f);
  if (precision > HLL_MAX_PRECISION) {
    RejectSketch(fmt::format("precision code {} is out of range", data[0] & 0x0f));
  }

  switch (format) {
    case FORMAT_SPARSE:
      return {precision, DecodeSparse(precision, data + 1, size - 1)};
    case FORMAT_DENSE:
      return {precision, DecodeDense(precision, data + 1, size - 1)};
    default:
      RejectSketch(fmt::format("unknown sketch format {}", format));
  }
}

/**
 * @brief Reads (index, value) records until less than one record is left.
 * @param body bytes after the header
 *
 * The leftover bits are padding. Zero values and repeated indices are rejected.
 */
auto GenericCodec::DecodeSparse(int16_t precision, const uint8_t *body, size_t size) -> RegisterMap {
  RegisterMap registers;
  BitReader reader(body, size);
  const auto record_bits = static_cast<size_t>(precision + HLL_REGISTER_BITS);
  while (reader.Remaining() >= record_bits) {
    uint32_t index = reader.Read(precision);
    auto value = static_cast<uint8_t>(reader.Read(HLL_REGISTER_BITS));
    if (value == 0) {
      RejectSketch(fmt::format("sparse record for register {} holds 0", index));
    }
    if (!registers.emplace(index, value).second) {
      RejectSketch(fmt::format("register {} appears twice", index));
    }
  }
  return registers;
}

auto GenericCodec::DecodeDense(int16_t precision, const uint8_t *body, size_t size) -> RegisterMap {
  const uint32_t m = 1U << precision;
  const size_t expected = m * HLL_REGISTER_BITS / 8;
  if (size != expected) {
    RejectSketch(
        fmt::format("dense body of precision {} needs {} bytes, got {}", precision, expected, size));
  }
  RegisterMap registers;
  BitReader reader(body, size);
  for (uint32_t i = 0; i < m; i++) {
    auto value = static_cast<uint8_t>(reader.Read(HLL_REGISTER_BITS));
    if (value != 0) {
      registers.emplace_hint(registers.end(), i, value);
    }
  }
  return registers;
}

}  // namespace hll
