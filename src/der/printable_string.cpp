#include "asn1/der/printable_string.hpp"

#include <algorithm>

namespace asn1::der {

bool is_printable_string(bytes_view bytes) noexcept {
  return std::all_of(bytes.begin(), bytes.end(), [](byte b) { return is_printable_char(b); });
}

}  // namespace asn1::der
