#pragma once

#include "asn1/core/common.hpp"
#include "asn1/der/reader.hpp"
#include "asn1/der/value.hpp"

#include <cstddef>
#include <string>
#include <system_error>

namespace asn1::utils {

/**
 * @brief DER 解码结果的可读化输出（调试/日志用途）。
 *
 * 说明：
 * - 输出格式接近 `openssl asn1parse -i` 的缩进风格，但不是其严格格式；
 * - 默认会对超长 payload 做截断，避免日志被巨量内容淹没。
 */
struct ValueDumpOptions final {
    // OCTET STRING / 超宽 INTEGER / 字符串最大输出字节数（0 表示不限制）。
    std::size_t max_payload_bytes{64};

    // 每层缩进空格数。
    std::size_t indent_spaces{2};

    // 是否输出 ANSI 颜色控制码（写入日志/文件时建议关闭）。
    bool enable_color{false};

    // 遍历时使用的解码选项（嵌套深度上限等）。
    asn1::der::ReaderOptions reader{};
};

/**
 * @brief 将单个 Value 格式化为一行（不含缩进与换行）。
 *
 * 结构事件输出为 "SEQUENCE {" / "SET {" / "}"。
 */
[[nodiscard]] std::string dump_value(const asn1::der::Value &value,
                                     const ValueDumpOptions &options = {});

/**
 * @brief 用 der::Reader 遍历整个缓冲区并输出缩进列表（每个 Value 一行）。
 *
 * 成功条件：读到顶层 end_of_input 且所有结构均已闭合。
 * 失败时返回第一个解码错误；out 保留失败之前已格式化的部分，便于定位。
 * 失败位置与原因同时以 debug 级别写入 "asn1" logger。
 */
std::error_code dump_values(asn1::core::bytes_view bytes,
                            std::string &out,
                            const ValueDumpOptions &options = {});

} // namespace asn1::utils
