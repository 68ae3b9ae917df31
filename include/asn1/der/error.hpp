#pragma once

#include <system_error>

namespace asn1::der {

/**
 * @brief DER 解码错误码（扁平、封闭集合，所有解码组件共用）。
 *
 * 约定：
 * - 所有失败立即返回给直接调用方，不做局部恢复、不返回部分结果；
 * - 非最简编码（长度/OID 分量）与结构损坏同等对待，一律视为硬错误。
 */
enum class errc : int {
  ok = 0,
  end_of_input = 1,
  overlong_length = 2,
  invalid_length_encoding = 3,
  indefinite_length = 4,
  unrecognized_type = 5,
  not_implemented = 6,
  incorrect_length = 7,
  malformed = 8,
  malformed_object_identifier = 9,
  object_identifier_too_large = 10,
  invalid_utf8 = 11,
  invalid_printable_string = 12,
  structure_overrun = 13,
  nesting_too_deep = 14,
  not_in_structure = 15,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace asn1::der

namespace std {
template <>
struct is_error_code_enum<asn1::der::errc> : true_type {};
}  // namespace std
