//===----------------------------------------------------------------------===//
//
//                         HLL
//
// registers.cpp
//
// Identification: src/sketch/registers.cpp
//
//===----------------------------------------------------------------------===//

#include "sketch/registers.h"

#include <algorithm>

namespace hll {

auto WouldUpdate(const RegisterMap &registers, uint32_t index, uint8_t value) -> bool {
  auto it = registers.find(index);
  return it == registers.end() ? value > 0 : it->second < value;
}

auto UpdateRegister(RegisterMap *registers, uint32_t index, uint8_t value) -> bool {
  if (value == 0) {
    return false;
  }
  auto [it, inserted] = registers->emplace(index, value);
  if (inserted) {
    return true;
  }
  if (it->second >= value) {
    return false;
  }
  it->second = value;
  return true;
}

/**
 * @brief Register-wise maximum of all inputs.
 *
 * 先复制最大的 map，再把其余的逐个合并进去，拷贝次数最少。
 */
auto MergeRegisters(const std::vector<const RegisterMap *> &inputs) -> RegisterMap {
  if (inputs.empty()) {
    return {};
  }
  std::vector<const RegisterMap *> sorted(inputs);
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const RegisterMap *a, const RegisterMap *b) { return a->size() > b->size(); });

  RegisterMap result = *sorted.front();
  for (size_t i = 1; i < sorted.size(); i++) {
    for (const auto &[index, value] : *sorted[i]) {
      UpdateRegister(&result, index, value);
    }
  }
  return result;
}

}  // namespace hll
