#include "asn1/utils/hex.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <optional>
#include <sstream>

namespace asn1::utils {
namespace {

constexpr const char *kHexDigits = "0123456789abcdef";

struct Ansi final {
    static constexpr const char *reset = "\033[0m";
    static constexpr const char *dim = "\033[2m";
    static constexpr const char *bytes = "\033[1;33m";
    static constexpr const char *ascii = "\033[1;32m";
    static constexpr const char *error = "\033[1;31m";
};

[[nodiscard]] const char *ansi_(bool enable, const char *code) noexcept {
    return enable ? code : "";
}

[[nodiscard]] std::optional<std::uint8_t> nibble_(unsigned char c) noexcept {
    if (c >= '0' && c <= '9') {
        return static_cast<std::uint8_t>(c - '0');
    }
    if (c >= 'a' && c <= 'f') {
        return static_cast<std::uint8_t>(c - 'a' + 10);
    }
    if (c >= 'A' && c <= 'F') {
        return static_cast<std::uint8_t>(c - 'A' + 10);
    }
    return std::nullopt;
}

[[nodiscard]] bool is_separator_(unsigned char c) noexcept {
    if (std::isspace(c) != 0) {
        return true;
    }
    constexpr std::string_view kSeparators = ",;:-_|/\\[](){}<>'\"";
    return kSeparators.find(static_cast<char>(c)) != std::string_view::npos;
}

void append_byte_(std::string &out, asn1::core::byte b) {
    out.push_back(kHexDigits[(b >> 4) & 0x0F]);
    out.push_back(kHexDigits[b & 0x0F]);
}

} // namespace

std::string to_hex(asn1::core::bytes_view bytes) {
    std::string out;
    out.reserve(bytes.size() * 2);
    for (auto b : bytes) {
        append_byte_(out, b);
    }
    return out;
}

std::string hex_dump(asn1::core::bytes_view bytes, HexDumpOptions options) {
    std::ostringstream oss;
    const bool color = options.enable_color;
    const auto *reset = ansi_(color, Ansi::reset);

    const std::size_t total = bytes.size();
    const std::size_t limit =
        (options.max_bytes == 0 ? total : std::min(total, options.max_bytes));
    const std::size_t per_line =
        (options.bytes_per_line == 0 ? std::size_t{16} : options.bytes_per_line);

    for (std::size_t offset = 0; offset < limit; offset += per_line) {
        const auto line = bytes.subspan(offset, std::min(per_line, limit - offset));

        if (options.show_offset) {
            oss << ansi_(color, Ansi::dim) << std::setw(4) << std::setfill('0')
                << std::hex << offset << std::dec << ": " << reset;
        }

        std::string hex;
        for (std::size_t i = 0; i < line.size(); ++i) {
            if (i != 0) {
                hex.push_back(' ');
            }
            append_byte_(hex, line[i]);
        }
        oss << ansi_(color, Ansi::bytes) << hex << reset;

        if (options.show_ascii) {
            // 末行不足 per_line 时补齐，保证 ASCII 列对齐。
            oss << std::string((per_line - line.size()) * 3 + 3, ' ');
            oss << ansi_(color, Ansi::ascii);
            for (auto b : line) {
                oss << ((b >= 0x20 && b <= 0x7E) ? static_cast<char>(b) : '.');
            }
            oss << reset;
        }
        oss << '\n';
    }

    if (limit < total) {
        oss << ansi_(color, Ansi::error) << "... (truncated, total=" << total
            << " bytes)" << reset << '\n';
    }
    return oss.str();
}

std::error_code parse_hex(std::string_view text,
                          std::vector<asn1::core::byte> &out) noexcept {
    out.clear();

    std::optional<std::uint8_t> high;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        if (is_separator_(c)) {
            continue;
        }

        // 可选 0x/0X 前缀：仅在字节边界处识别。
        if (!high && c == '0' && i + 1 < text.size() &&
            (text[i + 1] == 'x' || text[i + 1] == 'X')) {
            ++i;
            continue;
        }

        const auto v = nibble_(c);
        if (!v) {
            return asn1::core::make_error_code(asn1::core::errc::invalid_argument);
        }
        if (!high) {
            high = v;
            continue;
        }
        out.push_back(static_cast<asn1::core::byte>((*high << 4) | *v));
        high.reset();
    }

    if (high) {
        return asn1::core::make_error_code(asn1::core::errc::invalid_argument);
    }
    return {};
}

} // namespace asn1::utils
