#pragma once

#include "asn1/der/integer.hpp"
#include "asn1/der/object_identifier.hpp"
#include "asn1/der/types.hpp"

#include <algorithm>
#include <string_view>
#include <variant>

namespace asn1::der {

struct Null final {
  friend bool operator==(const Null&, const Null&) = default;
};

struct Boolean final {
  bool value{false};
  friend bool operator==(const Boolean&, const Boolean&) = default;
};

struct OctetString final {
  bytes_view value{};
  friend bool operator==(const OctetString& lhs, const OctetString& rhs) noexcept {
    return std::equal(lhs.value.begin(), lhs.value.end(), rhs.value.begin(), rhs.value.end());
  }
};

struct PrintableString final {
  std::string_view value{};
  friend bool operator==(const PrintableString&, const PrintableString&) = default;
};

struct Utf8String final {
  std::string_view value{};
  friend bool operator==(const Utf8String&, const Utf8String&) = default;
};

// 结构标记：不携带 payload，start/end 成对出现。
struct SequenceStart final {
  friend bool operator==(const SequenceStart&, const SequenceStart&) = default;
};
struct SequenceEnd final {
  friend bool operator==(const SequenceEnd&, const SequenceEnd&) = default;
};
struct SetStart final {
  friend bool operator==(const SetStart&, const SetStart&) = default;
};
struct SetEnd final {
  friend bool operator==(const SetEnd&, const SetEnd&) = default;
};

/**
 * @brief Reader::next() 产出的单个解码结果（扁平事件，不构建树）。
 *
 * 约定：
 * - 携带 payload 的变体（Integer/ObjectIdentifier/OctetString/各类字符串）都直接引用输入缓冲区，
 *   不复制字节；输入缓冲区在整个解码会话中只读，因此 payload 在缓冲区生命周期内有效；
 * - SEQUENCE/SET 的开始与结束各自作为一个独立的 Value 返回。
 */
class Value final {
 public:
  using storage_type = std::variant<Null,
                                    Boolean,
                                    Integer,
                                    ObjectIdentifier,
                                    OctetString,
                                    PrintableString,
                                    Utf8String,
                                    SequenceStart,
                                    SequenceEnd,
                                    SetStart,
                                    SetEnd>;

  Value() = default;

  explicit Value(Null v) noexcept : storage_(v) {}
  explicit Value(Boolean v) noexcept : storage_(v) {}
  explicit Value(Integer v) noexcept : storage_(v) {}
  explicit Value(ObjectIdentifier v) noexcept : storage_(v) {}
  explicit Value(OctetString v) noexcept : storage_(v) {}
  explicit Value(PrintableString v) noexcept : storage_(v) {}
  explicit Value(Utf8String v) noexcept : storage_(v) {}
  explicit Value(SequenceStart v) noexcept : storage_(v) {}
  explicit Value(SequenceEnd v) noexcept : storage_(v) {}
  explicit Value(SetStart v) noexcept : storage_(v) {}
  explicit Value(SetEnd v) noexcept : storage_(v) {}

  [[nodiscard]] const storage_type& storage() const noexcept { return storage_; }

  template <class T>
  [[nodiscard]] const T* get_if() const noexcept {
    return std::get_if<T>(&storage_);
  }

  template <class T>
  [[nodiscard]] bool holds() const noexcept {
    return std::holds_alternative<T>(storage_);
  }

  [[nodiscard]] bool is_structure_start() const noexcept { return holds<SequenceStart>() || holds<SetStart>(); }
  [[nodiscard]] bool is_structure_end() const noexcept { return holds<SequenceEnd>() || holds<SetEnd>(); }

  friend bool operator==(const Value&, const Value&) = default;

 private:
  storage_type storage_{};
};

}  // namespace asn1::der
