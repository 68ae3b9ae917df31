#include "asn1/der/types.hpp"

namespace asn1::der {

std::optional<tag> tag_from_byte(byte b) noexcept {
  switch (static_cast<tag>(b)) {
    case tag::boolean:
    case tag::integer:
    case tag::bit_string:
    case tag::octet_string:
    case tag::null:
    case tag::object_identifier:
    case tag::utf8_string:
    case tag::printable_string:
    case tag::ia5_string:
    case tag::bmp_string:
    case tag::sequence:
    case tag::set:
      return static_cast<tag>(b);
    default:
      return std::nullopt;
  }
}

const char* tag_name(tag t) noexcept {
  switch (t) {
    case tag::boolean:
      return "BOOLEAN";
    case tag::integer:
      return "INTEGER";
    case tag::bit_string:
      return "BIT STRING";
    case tag::octet_string:
      return "OCTET STRING";
    case tag::null:
      return "NULL";
    case tag::object_identifier:
      return "OBJECT IDENTIFIER";
    case tag::utf8_string:
      return "UTF8String";
    case tag::printable_string:
      return "PrintableString";
    case tag::ia5_string:
      return "IA5String";
    case tag::bmp_string:
      return "BMPString";
    case tag::sequence:
      return "SEQUENCE";
    case tag::set:
      return "SET";
  }
  return nullptr;
}

}  // namespace asn1::der
