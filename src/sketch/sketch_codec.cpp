//===----------------------------------------------------------------------===//
//
//                         HLL
//
// sketch_codec.cpp
//
// Identification: src/sketch/sketch_codec.cpp
//
//===----------------------------------------------------------------------===//

#include "sketch/sketch_codec.h"

#include "common/exception.h"
#include "common/logger.h"

namespace hll {

void RejectSketch(const std::string &reason) {
  LOG_WARN("rejecting sketch: %s", reason.c_str());
  throw MalformedInputException(reason);
}

}  // namespace hll
