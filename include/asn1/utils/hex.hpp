#pragma once

#include "asn1/core/common.hpp"
#include "asn1/core/error.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace asn1::utils {

/**
 * @brief 16 进制解析/格式化工具。
 *
 * 典型使用场景：
 * - 从 openssl asn1parse / 抓包里复制一段 “30 06 01 01 00 ...” 的字符串，解析为 bytes；
 * - 将 bytes 以 hexdump 形式输出，便于人工对照 TLV 字段。
 */

struct HexDumpOptions final {
    // 每行字节数（典型 16/32）。
    std::size_t bytes_per_line{16};

    // 输出的最大字节数（0 表示不限制）。超出部分会打印截断提示。
    std::size_t max_bytes{256};

    // 是否输出行首偏移（0000:）。
    bool show_offset{true};

    // 是否输出 ASCII 侧栏（仅展示可打印字符，其余用 '.'）。
    bool show_ascii{false};

    // 是否输出 ANSI 颜色控制码（写入日志/文件时建议关闭）。
    bool enable_color{false};
};

[[nodiscard]] std::string hex_dump(asn1::core::bytes_view bytes,
                                   HexDumpOptions options = {});

// 紧凑形式：小写、无分隔符（例如 "2a8648"）。
[[nodiscard]] std::string to_hex(asn1::core::bytes_view bytes);

/**
 * @brief 解析 16 进制字符串为 bytes。
 *
 * 支持大小写 hex、空白/逗号/冒号/连字符等分隔符，以及可选的 0x/0X 前缀。
 * 非法字符或奇数个 hex 数字返回 core::errc::invalid_argument。
 */
std::error_code parse_hex(std::string_view text,
                          std::vector<asn1::core::byte> &out) noexcept;

} // namespace asn1::utils
