#include "asn1/der/utf8.hpp"

#include <cstddef>
#include <cstdint>

namespace asn1::der {

bool is_valid_utf8(bytes_view bytes) noexcept {
  std::size_t i = 0;
  while (i < bytes.size()) {
    const std::uint8_t lead = bytes[i];
    if ((lead & 0x80u) == 0) {
      ++i;
      continue;
    }

    std::size_t needed = 0;
    std::uint32_t min_cp = 0;
    std::uint32_t cp = 0;
    if ((lead & 0xE0u) == 0xC0u) {
      needed = 1;
      min_cp = 0x80u;
      cp = lead & 0x1Fu;
    } else if ((lead & 0xF0u) == 0xE0u) {
      needed = 2;
      min_cp = 0x800u;
      cp = lead & 0x0Fu;
    } else if ((lead & 0xF8u) == 0xF0u) {
      needed = 3;
      min_cp = 0x10000u;
      cp = lead & 0x07u;
    } else {
      return false;
    }

    if (bytes.size() - i - 1 < needed) {
      return false;
    }
    for (std::size_t j = 1; j <= needed; ++j) {
      const std::uint8_t c = bytes[i + j];
      if ((c & 0xC0u) != 0x80u) {
        return false;
      }
      cp = (cp << 6) | (c & 0x3Fu);
    }

    if (cp < min_cp || cp > 0x10FFFFu || (cp >= 0xD800u && cp <= 0xDFFFu)) {
      return false;
    }
    i += needed + 1;
  }
  return true;
}

}  // namespace asn1::der
