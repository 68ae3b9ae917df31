#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace asn1::core {

using byte = std::uint8_t;
using bytes_view = std::span<const byte>;

// 字节视图与文本视图之间的零拷贝转换（仅重新解释指针，不做校验）。
[[nodiscard]] inline std::string_view as_string_view(bytes_view bytes) noexcept {
  return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

[[nodiscard]] inline bytes_view as_bytes_view(std::string_view text) noexcept {
  return {reinterpret_cast<const byte*>(text.data()), text.size()};
}

}  // 命名空间 asn1::core
