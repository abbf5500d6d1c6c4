//===----------------------------------------------------------------------===//
//
//                         HLL
//
// macros.h
//
// Identification: src/include/common/macros.h
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cassert>

namespace hll {

#define HLL_ASSERT(expr, message) assert((expr) && (message))

}  // namespace hll
