#include "asn1/der/error.hpp"

#include <string>

namespace asn1::der {
namespace {

class der_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "asn1.der"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::end_of_input:
        return "unexpected end of input";
      case errc::overlong_length:
        return "der length field too long";
      case errc::invalid_length_encoding:
        return "non-canonical der length encoding";
      case errc::indefinite_length:
        return "indefinite length is not supported";
      case errc::unrecognized_type:
        return "unrecognized der type tag";
      case errc::not_implemented:
        return "der type not implemented";
      case errc::incorrect_length:
        return "incorrect length for der type";
      case errc::malformed:
        return "malformed der value";
      case errc::malformed_object_identifier:
        return "malformed object identifier";
      case errc::object_identifier_too_large:
        return "object identifier component too large";
      case errc::invalid_utf8:
        return "invalid utf-8 string";
      case errc::invalid_printable_string:
        return "invalid printable string";
      case errc::structure_overrun:
        return "value overruns enclosing structure";
      case errc::nesting_too_deep:
        return "der nesting too deep";
      case errc::not_in_structure:
        return "not inside a structure";
      default:
        return "unknown asn1.der error";
    }
  }
};

}  // namespace

const std::error_category& error_category() noexcept {
  static der_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

}  // namespace asn1::der
