//===----------------------------------------------------------------------===//
//
//                         HLL
//
// registers.h
//
// Identification: src/include/sketch/registers.h
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <map>
#include <vector>

namespace hll {

/**
 * Populated registers of a sketch, bucket index -> run length.
 * An index missing from the map holds 0, so a stored value is always >= 1.
 */
using RegisterMap = std::map<uint32_t, uint8_t>;

/** One observation produced by a hash extractor. */
struct RegisterUpdate {
  uint32_t index_;
  uint8_t value_;
};

/**
 * @brief Raise registers[index] to value if it is currently lower.
 * @return true if the map changed
 */
auto UpdateRegister(RegisterMap *registers, uint32_t index, uint8_t value) -> bool;

/** @return true if applying the update would change the map */
auto WouldUpdate(const RegisterMap &registers, uint32_t index, uint8_t value) -> bool;

/**
 * @brief Per-index maximum of all inputs.
 *
 * The inputs are folded into a copy of the largest one so the number of
 * insertions stays small. All inputs are expected to share one precision.
 */
auto MergeRegisters(const std::vector<const RegisterMap *> &inputs) -> RegisterMap;

}  // namespace hll
