#include "asn1/utils/value_dump.hpp"

#include "asn1/utils/hex.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <type_traits>

namespace asn1::utils {
namespace {

struct Ansi final {
    static constexpr const char *reset = "\033[0m";
    static constexpr const char *type = "\033[1;35m";
    static constexpr const char *string = "\033[1;32m";
    static constexpr const char *value = "\033[1;33m";
    static constexpr const char *dim = "\033[2m";
};

[[nodiscard]] const char *ansi_(bool enable, const char *code) noexcept {
    return enable ? code : "";
}

[[nodiscard]] std::string indent_(std::size_t depth, std::size_t spaces) {
    return std::string(depth * spaces, ' ');
}

// UTF-8 多字节序列原样输出，只转义控制字符、引号与反斜杠。
void append_quoted_(std::ostringstream &oss,
                    std::string_view s,
                    std::size_t max_bytes) {
    const std::size_t n = (max_bytes == 0 ? s.size() : std::min(s.size(), max_bytes));
    oss << '"';
    for (std::size_t i = 0; i < n; ++i) {
        const auto c = static_cast<unsigned char>(s[i]);
        if (c == '\\' || c == '"') {
            oss << '\\' << static_cast<char>(c);
        } else if (c < 0x20 || c == 0x7F) {
            oss << "\\x" << std::hex << std::setw(2) << std::setfill('0')
                << static_cast<int>(c) << std::dec;
        } else {
            oss << static_cast<char>(c);
        }
    }
    if (n < s.size()) {
        oss << "...";
    }
    oss << '"';
}

void append_hex_(std::ostringstream &oss,
                 asn1::core::bytes_view bytes,
                 std::size_t max_bytes) {
    const std::size_t n =
        (max_bytes == 0 ? bytes.size() : std::min(bytes.size(), max_bytes));
    oss << to_hex(bytes.first(n));
    if (n < bytes.size()) {
        oss << "...";
    }
}

} // namespace

std::string dump_value(const asn1::der::Value &value,
                       const ValueDumpOptions &options) {
    namespace der = asn1::der;

    const bool color = options.enable_color;
    const auto *reset = ansi_(color, Ansi::reset);
    const auto *type = ansi_(color, Ansi::type);
    const auto *val = ansi_(color, Ansi::value);
    const auto *str = ansi_(color, Ansi::string);
    const auto *dim = ansi_(color, Ansi::dim);

    std::ostringstream oss;
    std::visit(
        [&](const auto &v) {
            using T = std::decay_t<decltype(v)>;

            if constexpr (std::is_same_v<T, der::Null>) {
                oss << type << der::tag_name(der::tag::null) << reset;
            } else if constexpr (std::is_same_v<T, der::Boolean>) {
                oss << type << der::tag_name(der::tag::boolean) << ' ' << reset << val
                    << (v.value ? "true" : "false") << reset;
            } else if constexpr (std::is_same_v<T, der::Integer>) {
                oss << type << der::tag_name(der::tag::integer) << ' ' << reset << val;
                if (const auto small = v.as_u64()) {
                    oss << *small;
                } else {
                    oss << "0x";
                    append_hex_(oss, v.as_bytes(), options.max_payload_bytes);
                }
                oss << reset;
            } else if constexpr (std::is_same_v<T, der::ObjectIdentifier>) {
                oss << type << der::tag_name(der::tag::object_identifier) << ' ' << reset << val
                    << v.to_string() << reset;
            } else if constexpr (std::is_same_v<T, der::OctetString>) {
                oss << type << der::tag_name(der::tag::octet_string) << '[' << v.value.size() << ']'
                    << reset;
                if (!v.value.empty()) {
                    oss << ' ' << val;
                    append_hex_(oss, v.value, options.max_payload_bytes);
                    oss << reset;
                }
            } else if constexpr (std::is_same_v<T, der::PrintableString>) {
                oss << type << der::tag_name(der::tag::printable_string) << ' ' << reset << str;
                append_quoted_(oss, v.value, options.max_payload_bytes);
                oss << reset;
            } else if constexpr (std::is_same_v<T, der::Utf8String>) {
                oss << type << der::tag_name(der::tag::utf8_string) << ' ' << reset << str;
                append_quoted_(oss, v.value, options.max_payload_bytes);
                oss << reset;
            } else if constexpr (std::is_same_v<T, der::SequenceStart>) {
                oss << type << der::tag_name(der::tag::sequence) << reset << dim << " {" << reset;
            } else if constexpr (std::is_same_v<T, der::SetStart>) {
                oss << type << der::tag_name(der::tag::set) << reset << dim << " {" << reset;
            } else {
                oss << dim << '}' << reset;
            }
        },
        value.storage());
    return oss.str();
}

std::error_code dump_values(asn1::core::bytes_view bytes,
                            std::string &out,
                            const ValueDumpOptions &options) {
    std::ostringstream oss;
    asn1::der::Reader reader(bytes, options.reader);
    asn1::der::Value value;

    for (;;) {
        const auto offset = reader.position();
        const auto ec = reader.next(value);
        if (ec == asn1::der::errc::end_of_input && reader.at_end()) {
            out = oss.str();
            return {};
        }
        if (ec) {
            asn1::core::detail::logger().debug(
                "der decode failed at offset {} (depth {}): {}",
                offset,
                reader.depth(),
                ec.message());
            out = oss.str();
            return ec;
        }

        // 结束事件出栈后 depth 已减一，与对应的开始事件同一缩进。
        const auto depth =
            value.is_structure_start() ? reader.depth() - 1 : reader.depth();
        oss << indent_(depth, options.indent_spaces) << dump_value(value, options)
            << '\n';
    }
}

} // namespace asn1::utils
