#pragma once

#include "asn1/der/error.hpp"
#include "asn1/der/types.hpp"
#include "asn1/der/value.hpp"

#include <cstddef>
#include <cstdint>
#include <system_error>
#include <vector>

namespace asn1::der {

struct ReaderOptions final {
  // 嵌套深度上限（0 表示不限制）。超过时 next() 返回 errc::nesting_too_deep；
  // 不限制时帧栈分配失败返回 core::errc::out_of_memory。
  std::size_t max_depth{kDefaultMaxDepth};
};

/**
 * @brief DER 流式解码器（拉取模式）：每次 next() 读取一个 TLV 单元并产出一个 Value。
 *
 * 说明：
 * - 不构建树，也不递归：SEQUENCE/SET 以 start/end 两个事件表示，嵌套关系由内部的
 *   “待结束位置”栈维护；
 * - 只支持 definite length；长度字段必须是最简编码（long form 不得有前导 0，且值必须 >= 128）；
 * - 复合类型的声明长度必须落在外层结构（或整个缓冲区）剩余空间之内；
 * - 基本类型的 payload 只受缓冲区边界约束，若越过外层结构末尾，下一次 next() 返回
 *   errc::structure_overrun。
 *
 * 典型用法：
 *   Reader r(bytes);
 *   Value v;
 *   while (!(ec = r.next(v))) { ... }
 *   // 正常结束时 ec == errc::end_of_input 且 r.at_end()
 *
 * 任一次失败之后 Reader 的内部状态不再有意义，调用方应放弃本次解码会话。
 */
class Reader final {
 public:
  explicit Reader(bytes_view input, ReaderOptions options = {}) noexcept;

  std::error_code next(Value& out) noexcept;

  /**
   * @brief 跳过当前最内层结构的剩余内容（不解码），下一次 next() 返回其结束事件。
   *
   * 顶层调用返回 errc::not_in_structure。
   */
  std::error_code skip_structure() noexcept;

  [[nodiscard]] std::size_t position() const noexcept { return pos_; }
  [[nodiscard]] std::size_t remaining() const noexcept { return input_.size() - pos_; }
  [[nodiscard]] std::size_t depth() const noexcept { return frames_.size(); }

  // 顶层且输入已全部消费。
  [[nodiscard]] bool at_end() const noexcept { return frames_.empty() && pos_ == input_.size(); }

 private:
  enum class structure_kind : std::uint8_t { sequence, set };

  struct Frame final {
    structure_kind kind{structure_kind::sequence};
    std::size_t end{0};
  };

  std::error_code read_u8_(byte& out) noexcept;
  std::error_code read_bytes_(std::size_t n, bytes_view& out) noexcept;
  std::error_code read_length_(std::size_t& out) noexcept;

  std::error_code read_boolean_(std::size_t length, Value& out) noexcept;
  std::error_code read_integer_(std::size_t length, Value& out) noexcept;
  std::error_code read_octet_string_(std::size_t length, Value& out) noexcept;
  std::error_code read_null_(std::size_t length, Value& out) noexcept;
  std::error_code read_object_identifier_(std::size_t length, Value& out) noexcept;
  std::error_code read_utf8_string_(std::size_t length, Value& out) noexcept;
  std::error_code read_printable_string_(std::size_t length, Value& out) noexcept;
  std::error_code read_structure_(std::size_t length, structure_kind kind, Value& out) noexcept;

  bytes_view input_{};
  std::size_t pos_{0};
  std::vector<Frame> frames_{};
  ReaderOptions options_{};
};

}  // namespace asn1::der
