#pragma once

#include "asn1/der/types.hpp"

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <string>
#include <system_error>
#include <vector>

namespace asn1::der {

/**
 * @brief OBJECT IDENTIFIER 内容的零拷贝视图：构造时一次性校验，分量按需惰性解码。
 *
 * 编码规则：
 * - 首字节打包前两个分量：x*40 + y（x < 3）；
 * - 其余分量为 base-128 变长整数，最高位为续位（1 表示后面还有字节）。
 *
 * 校验（ObjectIdentifier::parse）：
 * - 内容为空或首字节 >= 120：errc::malformed_object_identifier；
 * - 分量首字节为 0x80（多余的前导 0）：errc::malformed_object_identifier；
 * - 分量超过 4 个续字节：errc::object_identifier_too_large；
 * - 恰好 4 个续字节时额外要求首字节载荷 <= 0x0F（否则超出 32 bit，
 *   如 90 80 80 80 00），同样返回 errc::object_identifier_too_large；
 * - 内容以续字节结尾（分量未结束）：errc::malformed_object_identifier。
 *
 * digits() 每次调用都从头解码一个新的序列，不缓存结果。
 */
class ObjectIdentifier final {
 public:
  class digit_iterator final {
   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = std::uint32_t;
    using difference_type = std::ptrdiff_t;
    using pointer = const std::uint32_t*;
    using reference = const std::uint32_t&;

    digit_iterator() = default;
    explicit digit_iterator(bytes_view content) noexcept;

    reference operator*() const noexcept { return current_; }
    pointer operator->() const noexcept { return &current_; }

    digit_iterator& operator++() noexcept;
    digit_iterator operator++(int) noexcept {
      auto tmp = *this;
      ++*this;
      return tmp;
    }

    // 仅用于与 end() 比较：两个迭代器都已耗尽即相等。
    friend bool operator==(const digit_iterator& lhs, const digit_iterator& rhs) noexcept {
      return lhs.state_ == state::done && rhs.state_ == state::done;
    }

   private:
    enum class state : std::uint8_t { first, second, later, done };

    void decode_next_() noexcept;

    bytes_view rest_{};
    state state_{state::done};
    std::uint32_t current_{0};
  };

  class digit_range final {
   public:
    explicit digit_range(bytes_view content) noexcept : content_(content) {}

    [[nodiscard]] digit_iterator begin() const noexcept { return digit_iterator{content_}; }
    [[nodiscard]] digit_iterator end() const noexcept { return digit_iterator{}; }

   private:
    bytes_view content_{};
  };

  // 空 OID（未经 parse）：digits() 为空序列。
  ObjectIdentifier() = default;

  static std::error_code parse(bytes_view content, ObjectIdentifier& out) noexcept;

  [[nodiscard]] digit_range digits() const noexcept { return digit_range{content_}; }
  [[nodiscard]] bytes_view bytes() const noexcept { return content_; }

  [[nodiscard]] std::vector<std::uint32_t> to_vector() const;

  // 点分形式，例如 "1.2.840.113549.1.1.1"。
  [[nodiscard]] std::string to_string() const;

  friend bool operator==(const ObjectIdentifier& lhs, const ObjectIdentifier& rhs) noexcept;

 private:
  explicit ObjectIdentifier(bytes_view content) noexcept : content_(content) {}

  bytes_view content_{};
};

}  // namespace asn1::der
