#include "asn1/core/error.hpp"

#include <string>

namespace asn1::core {
namespace {

// core::errc 的 std::error_category 实现：
// - name() 用于区分错误域
// - message() 返回可读的英文描述（便于调试与日志）
class asn1_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "asn1.core"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::invalid_argument:
        return "invalid argument";
      case errc::out_of_memory:
        return "out of memory";
      default:
        return "unknown asn1.core error";
    }
  }
};

}  // 匿名命名空间

const std::error_category& error_category() noexcept {
  static asn1_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

}  // 命名空间 asn1::core
