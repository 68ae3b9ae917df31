#pragma once

#include "asn1/der/types.hpp"

#include <array>
#include <cstdint>

namespace asn1::der {

/**
 * @brief PrintableString 字符集位图（256 bit，按 8 个 32-bit word 组织）。
 *
 * 允许：A-Z a-z 0-9、空格，以及 ' ( ) + , - . / : = ?
 * word i 的 bit j 对应字节值 32*i + j。
 */
inline constexpr std::array<std::uint32_t, 8> kPrintableCharMask = {
  0x00000000u,
  0xA7FFFB81u,  // 0x20..0x3F：空格 ' ( ) + , - . / 0-9 : = ?
  0x07FFFFFEu,  // 0x40..0x5F：A-Z
  0x07FFFFFEu,  // 0x60..0x7F：a-z
  0x00000000u,
  0x00000000u,
  0x00000000u,
  0x00000000u,
};

[[nodiscard]] constexpr bool is_printable_char(byte b) noexcept {
  return (kPrintableCharMask[b / 32u] & (std::uint32_t{1} << (b % 32u))) != 0;
}

[[nodiscard]] bool is_printable_string(bytes_view bytes) noexcept;

}  // namespace asn1::der
