#include "asn1/der/object_identifier.hpp"

#include "asn1/der/error.hpp"

#include <algorithm>

namespace asn1::der {
namespace {

// 分量最多 1 个起始字节 + 3 个中间字节 + 1 个结束字节（即 4 个续字节）。
constexpr std::size_t kMaxContinuationBytes = 4;

// 5 字节分量共 35 bit，起始字节最多携带 4 个有效 bit 才能放进 uint32_t。
constexpr byte kMaxLeadPayloadFor5Bytes = 0x0F;

constexpr byte kContinuationBit = 0x80;
constexpr byte kPayloadMask = 0x7F;

// 首字节 = x*40 + y，且 x < 3。
constexpr byte kFirstByteLimit = 3 * 40;

}  // namespace

ObjectIdentifier::digit_iterator::digit_iterator(bytes_view content) noexcept : rest_(content) {
  if (rest_.empty()) {
    return;
  }
  state_ = state::first;
  current_ = static_cast<std::uint32_t>(rest_[0] / 40u);
}

ObjectIdentifier::digit_iterator& ObjectIdentifier::digit_iterator::operator++() noexcept {
  switch (state_) {
    case state::first:
      state_ = state::second;
      current_ = static_cast<std::uint32_t>(rest_[0] % 40u);
      break;
    case state::second:
      rest_ = rest_.subspan(1);
      state_ = state::later;
      decode_next_();
      break;
    case state::later:
      decode_next_();
      break;
    case state::done:
      break;
  }
  return *this;
}

void ObjectIdentifier::digit_iterator::decode_next_() noexcept {
  std::uint32_t acc = 0;
  for (std::size_t i = 0; i < rest_.size(); ++i) {
    const byte b = rest_[i];
    acc = (acc << 7) | static_cast<std::uint32_t>(b & kPayloadMask);
    if ((b & kContinuationBit) == 0) {
      rest_ = rest_.subspan(i + 1);
      current_ = acc;
      return;
    }
  }
  // 内容耗尽（parse 已保证不会在分量中间结束）。
  rest_ = {};
  state_ = state::done;
}

std::error_code ObjectIdentifier::parse(bytes_view content, ObjectIdentifier& out) noexcept {
  if (content.empty() || content[0] >= kFirstByteLimit) {
    return make_error_code(errc::malformed_object_identifier);
  }

  std::size_t continuation = 0;
  byte lead = 0;
  for (byte b : content.subspan(1)) {
    if ((b & kContinuationBit) == 0) {
      if (continuation == kMaxContinuationBytes && (lead & kPayloadMask) > kMaxLeadPayloadFor5Bytes) {
        return make_error_code(errc::object_identifier_too_large);
      }
      continuation = 0;
      continue;
    }
    if (continuation == 0) {
      if (b == kContinuationBit) {
        // 分量以 0x80 开头：前导 0，非最简编码。
        return make_error_code(errc::malformed_object_identifier);
      }
      lead = b;
    }
    ++continuation;
    if (continuation > kMaxContinuationBytes) {
      return make_error_code(errc::object_identifier_too_large);
    }
  }

  if (continuation != 0) {
    return make_error_code(errc::malformed_object_identifier);
  }

  out = ObjectIdentifier{content};
  return {};
}

std::vector<std::uint32_t> ObjectIdentifier::to_vector() const {
  std::vector<std::uint32_t> out;
  for (auto d : digits()) {
    out.push_back(d);
  }
  return out;
}

std::string ObjectIdentifier::to_string() const {
  std::string out;
  for (auto d : digits()) {
    if (!out.empty()) {
      out.push_back('.');
    }
    out += std::to_string(d);
  }
  return out;
}

bool operator==(const ObjectIdentifier& lhs, const ObjectIdentifier& rhs) noexcept {
  return std::equal(lhs.content_.begin(), lhs.content_.end(), rhs.content_.begin(), rhs.content_.end());
}

}  // namespace asn1::der
