#pragma once

#include <spdlog/logger.h>

namespace asn1::core::detail {

// 库内部使用的命名 logger（"asn1"），输出到 stderr；级别跟随 set_log_level。
// 仅在 .cpp 中使用，避免把 spdlog 类型泄漏到 public headers。
spdlog::logger& logger();

}  // namespace asn1::core::detail
