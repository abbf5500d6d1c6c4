//===----------------------------------------------------------------------===//
//
//                         HLL
//
// item.h
//
// Identification: src/include/sketch/item.h
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <fmt/format.h>

namespace hll {

/** What an Item was built from. The value doubles as the generic hash seed. */
enum class ItemKind : uint8_t { BINARY = 0, INTEGER = 1, FLOAT = 2 };

/**
 * @brief An element offered to a sketch, reduced to a canonical byte string.
 *
 * Byte strings are taken as-is. Integers and floating point values are
 * rendered as text, which is what a Redis client sends for `PFADD key 42`.
 */
class Item {
 public:
  Item(std::string bytes) : kind_(ItemKind::BINARY), bytes_(std::move(bytes)) {}  // NOLINT
  Item(std::string_view bytes) : kind_(ItemKind::BINARY), bytes_(bytes) {}        // NOLINT
  Item(const char *bytes) : kind_(ItemKind::BINARY), bytes_(bytes) {}             // NOLINT

  template <typename T, typename = std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>>
  Item(T value) : kind_(ItemKind::INTEGER), bytes_(fmt::format_int(value).str()) {}  // NOLINT

  Item(double value) : kind_(ItemKind::FLOAT), bytes_(fmt::format("{}", value)) {}  // NOLINT

  Item(bool value) = delete;

  auto GetKind() const -> ItemKind { return kind_; }
  auto GetBytes() const -> std::string_view { return bytes_; }
  auto GetData() const -> const uint8_t * { return reinterpret_cast<const uint8_t *>(bytes_.data()); }
  auto GetSize() const -> size_t { return bytes_.size(); }

 private:
  ItemKind kind_;
  std::string bytes_;
};

}  // namespace hll
