#include "asn1/der/integer.hpp"

#include <algorithm>

namespace asn1::der {
namespace {

template <class UInt>
std::optional<UInt> fold_be(bytes_view bytes) noexcept {
  if (bytes.size() > sizeof(UInt)) {
    return std::nullopt;
  }
  UInt v = 0;
  for (byte b : bytes) {
    v = static_cast<UInt>((v << 8) | b);
  }
  return v;
}

}  // namespace

std::optional<std::uint8_t> Integer::as_u8() const noexcept { return fold_be<std::uint8_t>(bytes_); }

std::optional<std::uint16_t> Integer::as_u16() const noexcept { return fold_be<std::uint16_t>(bytes_); }

std::optional<std::uint32_t> Integer::as_u32() const noexcept { return fold_be<std::uint32_t>(bytes_); }

std::optional<std::uint64_t> Integer::as_u64() const noexcept { return fold_be<std::uint64_t>(bytes_); }

bool operator==(const Integer& lhs, const Integer& rhs) noexcept {
  return std::equal(lhs.bytes_.begin(), lhs.bytes_.end(), rhs.bytes_.begin(), rhs.bytes_.end());
}

}  // namespace asn1::der
