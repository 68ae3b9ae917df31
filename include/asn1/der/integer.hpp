#pragma once

#include "asn1/der/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>

namespace asn1::der {

/**
 * @brief INTEGER 内容的零拷贝视图（不复制、不在构造时解释字节）。
 *
 * 约定：
 * - 内容按 big-endian 无符号方式折叠，不处理二进制补码符号位；
 * - as_u8/as_u16/as_u32/as_u64 在字节数超过目标宽度时返回 std::nullopt（不是错误），
 *   调用方可改用 as_bytes() 自行解释；
 * - 空内容折叠为 0。
 */
class Integer final {
 public:
  Integer() = default;
  explicit Integer(bytes_view bytes) noexcept : bytes_(bytes) {}

  [[nodiscard]] std::optional<std::uint8_t> as_u8() const noexcept;
  [[nodiscard]] std::optional<std::uint16_t> as_u16() const noexcept;
  [[nodiscard]] std::optional<std::uint32_t> as_u32() const noexcept;
  [[nodiscard]] std::optional<std::uint64_t> as_u64() const noexcept;

  [[nodiscard]] bytes_view as_bytes() const noexcept { return bytes_; }
  [[nodiscard]] std::size_t size() const noexcept { return bytes_.size(); }

  friend bool operator==(const Integer& lhs, const Integer& rhs) noexcept;

 private:
  bytes_view bytes_{};
};

}  // namespace asn1::der
