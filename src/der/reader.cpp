#include "asn1/der/reader.hpp"

#include "asn1/core/error.hpp"
#include "asn1/der/printable_string.hpp"
#include "asn1/der/utf8.hpp"

#include <new>

namespace asn1::der {
namespace {

constexpr byte kBooleanFalse = 0x00;
constexpr byte kBooleanTrue = 0xFF;
constexpr byte kLengthCountMask = 0x7F;

}  // namespace

Reader::Reader(bytes_view input, ReaderOptions options) noexcept : input_(input), options_(options) {}

std::error_code Reader::read_u8_(byte& out) noexcept {
  if (pos_ >= input_.size()) {
    return make_error_code(errc::end_of_input);
  }
  out = input_[pos_++];
  return {};
}

std::error_code Reader::read_bytes_(std::size_t n, bytes_view& out) noexcept {
  // pos_ <= size 恒成立；以减法比较，避免 pos_ + n 溢出。
  if (n > input_.size() - pos_) {
    return make_error_code(errc::end_of_input);
  }
  out = input_.subspan(pos_, n);
  pos_ += n;
  return {};
}

std::error_code Reader::read_length_(std::size_t& out) noexcept {
  byte initial = 0;
  auto ec = read_u8_(initial);
  if (ec) {
    return ec;
  }

  if ((initial & kLongFormFlag) == 0) {
    out = initial;
    return {};
  }

  const auto count = static_cast<std::size_t>(initial & kLengthCountMask);
  if (count == 0) {
    return make_error_code(errc::indefinite_length);
  }
  if (count > kMaxLengthBytes) {
    return make_error_code(errc::overlong_length);
  }

  bytes_view length_bytes{};
  ec = read_bytes_(count, length_bytes);
  if (ec) {
    return ec;
  }

  // 最高字节为 0 说明用了多余的字节。
  if (length_bytes[0] == 0) {
    return make_error_code(errc::invalid_length_encoding);
  }

  std::size_t length = 0;
  for (byte b : length_bytes) {
    length = (length << 8) | b;
  }

  // short form 能表达的长度不允许用 long form 编码。
  if (length <= kMaxShortFormLength) {
    return make_error_code(errc::invalid_length_encoding);
  }

  out = length;
  return {};
}

std::error_code Reader::read_boolean_(std::size_t length, Value& out) noexcept {
  if (length != 1) {
    return make_error_code(errc::incorrect_length);
  }
  byte b = 0;
  auto ec = read_u8_(b);
  if (ec) {
    return ec;
  }
  switch (b) {
    case kBooleanFalse:
      out = Value{Boolean{false}};
      return {};
    case kBooleanTrue:
      out = Value{Boolean{true}};
      return {};
    default:
      return make_error_code(errc::malformed);
  }
}

std::error_code Reader::read_integer_(std::size_t length, Value& out) noexcept {
  bytes_view content{};
  auto ec = read_bytes_(length, content);
  if (ec) {
    return ec;
  }
  out = Value{Integer{content}};
  return {};
}

std::error_code Reader::read_octet_string_(std::size_t length, Value& out) noexcept {
  bytes_view content{};
  auto ec = read_bytes_(length, content);
  if (ec) {
    return ec;
  }
  out = Value{OctetString{content}};
  return {};
}

std::error_code Reader::read_null_(std::size_t length, Value& out) noexcept {
  if (length != 0) {
    return make_error_code(errc::incorrect_length);
  }
  out = Value{Null{}};
  return {};
}

std::error_code Reader::read_object_identifier_(std::size_t length, Value& out) noexcept {
  bytes_view content{};
  auto ec = read_bytes_(length, content);
  if (ec) {
    return ec;
  }
  ObjectIdentifier oid;
  ec = ObjectIdentifier::parse(content, oid);
  if (ec) {
    return ec;
  }
  out = Value{oid};
  return {};
}

std::error_code Reader::read_utf8_string_(std::size_t length, Value& out) noexcept {
  bytes_view content{};
  auto ec = read_bytes_(length, content);
  if (ec) {
    return ec;
  }
  if (!is_valid_utf8(content)) {
    return make_error_code(errc::invalid_utf8);
  }
  out = Value{Utf8String{core::as_string_view(content)}};
  return {};
}

std::error_code Reader::read_printable_string_(std::size_t length, Value& out) noexcept {
  bytes_view content{};
  auto ec = read_bytes_(length, content);
  if (ec) {
    return ec;
  }
  if (!is_printable_string(content)) {
    return make_error_code(errc::invalid_printable_string);
  }
  if (!is_valid_utf8(content)) {
    return make_error_code(errc::invalid_utf8);
  }
  out = Value{PrintableString{core::as_string_view(content)}};
  return {};
}

std::error_code Reader::read_structure_(std::size_t length, structure_kind kind, Value& out) noexcept {
  const std::size_t max_end = frames_.empty() ? input_.size() : frames_.back().end;
  if (length > max_end || pos_ > max_end - length) {
    return make_error_code(errc::end_of_input);
  }
  if (options_.max_depth != 0 && frames_.size() >= options_.max_depth) {
    return make_error_code(errc::nesting_too_deep);
  }

  try {
    frames_.push_back(Frame{kind, pos_ + length});
  } catch (const std::bad_alloc&) {
    return core::make_error_code(core::errc::out_of_memory);
  }
  if (kind == structure_kind::sequence) {
    out = Value{SequenceStart{}};
  } else {
    out = Value{SetStart{}};
  }
  return {};
}

std::error_code Reader::next(Value& out) noexcept {
  if (!frames_.empty()) {
    const Frame innermost = frames_.back();
    if (pos_ > innermost.end) {
      return make_error_code(errc::structure_overrun);
    }
    if (pos_ == innermost.end) {
      frames_.pop_back();
      if (innermost.kind == structure_kind::sequence) {
        out = Value{SequenceEnd{}};
      } else {
        out = Value{SetEnd{}};
      }
      return {};
    }
  }

  byte type_byte = 0;
  auto ec = read_u8_(type_byte);
  if (ec) {
    return ec;
  }

  std::size_t length = 0;
  ec = read_length_(length);
  if (ec) {
    return ec;
  }

  const auto t = tag_from_byte(type_byte);
  if (!t) {
    return make_error_code(errc::unrecognized_type);
  }

  switch (*t) {
    case tag::boolean:
      return read_boolean_(length, out);
    case tag::integer:
      return read_integer_(length, out);
    case tag::octet_string:
      return read_octet_string_(length, out);
    case tag::null:
      return read_null_(length, out);
    case tag::object_identifier:
      return read_object_identifier_(length, out);
    case tag::utf8_string:
      return read_utf8_string_(length, out);
    case tag::printable_string:
      return read_printable_string_(length, out);
    case tag::sequence:
      return read_structure_(length, structure_kind::sequence, out);
    case tag::set:
      return read_structure_(length, structure_kind::set, out);
    case tag::bit_string:
    case tag::ia5_string:
    case tag::bmp_string:
      return make_error_code(errc::not_implemented);
  }
  return make_error_code(errc::unrecognized_type);
}

std::error_code Reader::skip_structure() noexcept {
  if (frames_.empty()) {
    return make_error_code(errc::not_in_structure);
  }
  const auto end = frames_.back().end;
  if (pos_ > end) {
    return make_error_code(errc::structure_overrun);
  }
  pos_ = end;
  return {};
}

}  // namespace asn1::der
