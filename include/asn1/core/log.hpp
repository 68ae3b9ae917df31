#pragma once

#include <cstdint>

namespace asn1::core {

/**
 * @brief 日志级别（用于库内 spdlog 日志的统一控制）。
 *
 * 说明：
 * - 解码引擎（asn1::der::Reader）本身不输出日志，失败一律通过 error_code 返回；
 * - 工具层（asn1::utils）在 debug 级别记录解码失败的位置与原因；
 * - 本库不把 spdlog 类型暴露到 public headers，业务侧可通过 set_log_level 调整全局级别。
 */
enum class LogLevel : std::uint8_t {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    critical = 5,
    off = 6,
};

void set_log_level(LogLevel level) noexcept;
[[nodiscard]] LogLevel log_level() noexcept;

} // namespace asn1::core
