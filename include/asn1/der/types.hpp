#pragma once

#include "asn1/core/common.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>

namespace asn1::der {

using byte = asn1::core::byte;
using bytes_view = asn1::core::bytes_view;

/**
 * @brief 支持识别的 universal 类型 tag（单字节，含 constructed 位）。
 *
 * 说明：
 * - bit_string / ia5_string / bmp_string 可识别但未实现解码，读取时返回 errc::not_implemented；
 * - sequence / set 为 constructed 形式（0x20 位已置位）。
 */
enum class tag : std::uint8_t {
  boolean = 0x01,
  integer = 0x02,
  bit_string = 0x03,
  octet_string = 0x04,
  null = 0x05,
  object_identifier = 0x06,
  utf8_string = 0x0C,
  printable_string = 0x13,
  ia5_string = 0x16,
  bmp_string = 0x1E,
  sequence = 0x30,
  set = 0x31,
};

// 长度字段 long form 的字节数上限：超过 size_t 宽度的长度永远无法满足。
inline constexpr std::size_t kMaxLengthBytes = sizeof(std::size_t);

// short form 可表达的最大长度；long form 编出的值必须大于它。
inline constexpr std::size_t kMaxShortFormLength = 0x7F;

inline constexpr byte kLongFormFlag = 0x80;

// 默认的嵌套深度上限（ReaderOptions::max_depth）。
inline constexpr std::size_t kDefaultMaxDepth = 64;

[[nodiscard]] std::optional<tag> tag_from_byte(byte b) noexcept;

// 调试/日志用途的类型名（如 "SEQUENCE"）；未知 tag 返回 nullptr。
[[nodiscard]] const char* tag_name(tag t) noexcept;

}  // namespace asn1::der
