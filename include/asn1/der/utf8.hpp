#pragma once

#include "asn1/der/types.hpp"

namespace asn1::der {

/**
 * @brief 严格 UTF-8 校验（RFC 3629）。
 *
 * 拒绝：孤立的续字节、截断序列、overlong 编码、代理区（U+D800..U+DFFF）、
 * 以及大于 U+10FFFF 的码点。
 */
[[nodiscard]] bool is_valid_utf8(bytes_view bytes) noexcept;

}  // namespace asn1::der
