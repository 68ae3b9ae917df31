#pragma once

#include <system_error>

namespace asn1::core {

/**
 * @brief 本库通用错误码（跨模块复用）。
 *
 * 约定：
 * - 所有解析类接口返回 std::error_code，避免异常路径；
 * - 各模块（如 asn1::der）有自己的 errc 与 error_category，此处只放与编码无关的错误。
 */
enum class errc : int {
  ok = 0,
  invalid_argument = 1,
  out_of_memory = 2,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace asn1::core

namespace std {
template <>
struct is_error_code_enum<asn1::core::errc> : true_type {};
}  // namespace std
