#include "asn1/der/reader.hpp"

#include "test_main.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace {

using asn1::der::Boolean;
using asn1::der::byte;
using asn1::der::bytes_view;
using asn1::der::errc;
using asn1::der::Integer;
using asn1::der::Null;
using asn1::der::ObjectIdentifier;
using asn1::der::OctetString;
using asn1::der::PrintableString;
using asn1::der::Reader;
using asn1::der::ReaderOptions;
using asn1::der::SequenceEnd;
using asn1::der::SequenceStart;
using asn1::der::SetEnd;
using asn1::der::SetStart;
using asn1::der::Utf8String;
using asn1::der::Value;

bytes_view view(const std::vector<byte> &in) { return bytes_view{in.data(), in.size()}; }

// 读到第一个错误为止，返回该错误（正常结束时为 end_of_input）。
std::error_code read_all(const std::vector<byte> &in,
                         std::vector<Value> &out,
                         ReaderOptions options = {}) {
    Reader r(view(in), options);
    out.clear();
    for (;;) {
        Value v;
        auto ec = r.next(v);
        if (ec) {
            return ec;
        }
        out.push_back(v);
    }
}

std::error_code first_error(const std::vector<byte> &in) {
    std::vector<Value> ignored;
    return read_all(in, ignored);
}

// SEQUENCE { SEQUENCE { rsaEncryption, NULL }, SET { PrintableString "Test Corp" } }
std::vector<byte> sample_document() {
    return {
        0x30, 0x1C,
        0x30, 0x0D,
        0x06, 0x09, 0x2A, 0x86, 0x48, 0x86, 0xF7, 0x0D, 0x01, 0x01, 0x01,
        0x05, 0x00,
        0x31, 0x0B,
        0x13, 0x09, 'T', 'e', 's', 't', ' ', 'C', 'o', 'r', 'p',
    };
}

void test_sequence_of_booleans() {
    const std::vector<byte> in{0x30, 0x06, 0x01, 0x01, 0x00, 0x01, 0x01, 0xFF};
    Reader r(view(in));
    Value v;

    TEST_EXPECT_OK(r.next(v));
    TEST_EXPECT(v.holds<SequenceStart>());
    TEST_EXPECT_EQ(r.depth(), static_cast<std::size_t>(1));

    TEST_EXPECT_OK(r.next(v));
    TEST_EXPECT(v == Value{Boolean{false}});

    TEST_EXPECT_OK(r.next(v));
    TEST_EXPECT(v == Value{Boolean{true}});

    TEST_EXPECT_OK(r.next(v));
    TEST_EXPECT(v.holds<SequenceEnd>());
    TEST_EXPECT_EQ(r.depth(), static_cast<std::size_t>(0));
    TEST_EXPECT(r.at_end());

    TEST_EXPECT_EC(r.next(v), errc::end_of_input);
}

void test_short_form_length_consumes_exactly() {
    const std::vector<byte> in{0x04, 0x03, 0xAA, 0xBB, 0xCC, 0x05, 0x00};
    Reader r(view(in));
    Value v;

    TEST_EXPECT_OK(r.next(v));
    const auto *octets = v.get_if<OctetString>();
    TEST_EXPECT(octets != nullptr);
    if (octets != nullptr) {
        TEST_EXPECT_EQ(octets->value.size(), static_cast<std::size_t>(3));
        // 零拷贝：payload 直接指向输入缓冲区。
        TEST_EXPECT(octets->value.data() == in.data() + 2);
    }
    TEST_EXPECT_EQ(r.position(), static_cast<std::size_t>(5));

    TEST_EXPECT_OK(r.next(v));
    TEST_EXPECT(v.holds<Null>());
    TEST_EXPECT(r.at_end());
    TEST_EXPECT_EQ(r.remaining(), static_cast<std::size_t>(0));
}

void test_long_form_lengths() {
    {
        std::vector<byte> in{0x04, 0x81, 0x80};
        in.resize(in.size() + 0x80, 0x5A);
        Reader r(view(in));
        Value v;
        TEST_EXPECT_OK(r.next(v));
        const auto *octets = v.get_if<OctetString>();
        TEST_EXPECT(octets != nullptr && octets->value.size() == 0x80);
        TEST_EXPECT(r.at_end());
    }
    {
        std::vector<byte> in{0x04, 0x82, 0x01, 0x00};
        in.resize(in.size() + 0x100, 0x00);
        Reader r(view(in));
        Value v;
        TEST_EXPECT_OK(r.next(v));
        const auto *octets = v.get_if<OctetString>();
        TEST_EXPECT(octets != nullptr && octets->value.size() == 0x100);
        TEST_EXPECT_EQ(r.position(), in.size());
    }
}

void test_non_canonical_lengths_rejected() {
    // long form 编码了 short form 范围内的值。
    TEST_EXPECT_EC(first_error({0x04, 0x81, 0x05, 1, 2, 3, 4, 5}), errc::invalid_length_encoding);
    TEST_EXPECT_EC(first_error({0x04, 0x81, 0x7F}), errc::invalid_length_encoding);

    // 前导 0 字节（即使值本身 >= 128）。
    std::vector<byte> padded{0x04, 0x82, 0x00, 0x80};
    padded.resize(padded.size() + 0x80, 0x00);
    TEST_EXPECT_EC(first_error(padded), errc::invalid_length_encoding);

    // 结构也走同一套长度规则。
    TEST_EXPECT_EC(first_error({0x30, 0x81, 0x03, 0x05, 0x00, 0x00}), errc::invalid_length_encoding);
}

void test_indefinite_and_overlong_lengths() {
    TEST_EXPECT_EC(first_error({0x30, 0x80, 0x05, 0x00, 0x00, 0x00}), errc::indefinite_length);

    const auto too_many = static_cast<byte>(0x80 | (sizeof(std::size_t) + 1));
    TEST_EXPECT_EC(first_error({0x04, too_many, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10}), errc::overlong_length);
    TEST_EXPECT_EC(first_error({0x04, 0xFF}), errc::overlong_length);

    // 字节数在上限内但值远超缓冲区：按 end_of_input 处理，不会溢出。
    std::vector<byte> huge{0x04, static_cast<byte>(0x80 | sizeof(std::size_t))};
    huge.push_back(0x7F);
    huge.resize(huge.size() + sizeof(std::size_t) - 1, 0xFF);
    TEST_EXPECT_EC(first_error(huge), errc::end_of_input);

    std::vector<byte> huge_structure = huge;
    huge_structure[0] = 0x30;
    TEST_EXPECT_EC(first_error(huge_structure), errc::end_of_input);
}

void test_truncated_input() {
    TEST_EXPECT_EC(first_error({}), errc::end_of_input);
    TEST_EXPECT_EC(first_error({0x04}), errc::end_of_input);
    TEST_EXPECT_EC(first_error({0x04, 0x05, 0xAA}), errc::end_of_input);
    TEST_EXPECT_EC(first_error({0x04, 0x82, 0x01}), errc::end_of_input);
    TEST_EXPECT_EC(first_error({0x30, 0x05, 0x01, 0x01, 0x00}), errc::end_of_input);

    // 任意截断前缀都只会得到 end_of_input。
    const auto full = sample_document();
    for (std::size_t n = 0; n < full.size(); ++n) {
        const std::vector<byte> prefix(full.begin(), full.begin() + static_cast<std::ptrdiff_t>(n));
        TEST_EXPECT_EC(first_error(prefix), errc::end_of_input);
    }
}

void test_boolean_and_null() {
    TEST_EXPECT_EC(first_error({0x01, 0x01, 0x01}), errc::malformed);
    TEST_EXPECT_EC(first_error({0x01, 0x01, 0x7F}), errc::malformed);
    TEST_EXPECT_EC(first_error({0x01, 0x02, 0x00, 0x00}), errc::incorrect_length);
    TEST_EXPECT_EC(first_error({0x01, 0x00}), errc::incorrect_length);
    TEST_EXPECT_EC(first_error({0x05, 0x01, 0x00}), errc::incorrect_length);

    std::vector<Value> values;
    TEST_EXPECT_EC(read_all({0x05, 0x00, 0x05, 0x00}, values), errc::end_of_input);
    TEST_EXPECT_EQ(values.size(), static_cast<std::size_t>(2));
    TEST_EXPECT(values.size() == 2 && values[0].holds<Null>() && values[1].holds<Null>());
}

void test_integer() {
    const std::vector<byte> in{0x02, 0x01, 0x03, 0x02, 0x00, 0x02, 0x05, 1, 2, 3, 4, 5};
    Reader r(view(in));
    Value v;

    TEST_EXPECT_OK(r.next(v));
    const auto *small = v.get_if<Integer>();
    TEST_EXPECT(small != nullptr && small->as_u8() == std::uint8_t{3});

    TEST_EXPECT_OK(r.next(v));
    const auto *empty = v.get_if<Integer>();
    TEST_EXPECT(empty != nullptr && empty->size() == 0);

    TEST_EXPECT_OK(r.next(v));
    const auto *wide = v.get_if<Integer>();
    TEST_EXPECT(wide != nullptr);
    if (wide != nullptr) {
        TEST_EXPECT(!wide->as_u32().has_value());
        TEST_EXPECT(wide->as_u64() == std::uint64_t{0x0102030405});
    }
    TEST_EXPECT(r.at_end());
}

void test_object_identifier() {
    const std::vector<byte> in{0x06, 0x09, 0x2A, 0x86, 0x48, 0x86, 0xF7, 0x0D, 0x01, 0x01, 0x01};
    Reader r(view(in));
    Value v;
    TEST_EXPECT_OK(r.next(v));
    const auto *oid = v.get_if<ObjectIdentifier>();
    TEST_EXPECT(oid != nullptr);
    if (oid != nullptr) {
        TEST_EXPECT_EQ(oid->to_string(), "1.2.840.113549.1.1.1");
    }

    TEST_EXPECT_EC(first_error({0x06, 0x00}), errc::malformed_object_identifier);
    TEST_EXPECT_EC(first_error({0x06, 0x02, 0x2A, 0x86}), errc::malformed_object_identifier);
    TEST_EXPECT_EC(first_error({0x06, 0x07, 0x2A, 0x81, 0x81, 0x81, 0x81, 0x81, 0x01}),
                   errc::object_identifier_too_large);
}

void test_strings() {
    {
        const std::vector<byte> in{0x0C, 0x02, 0xC3, 0xA9, 0x13, 0x05, 'H', 'e', 'l', 'l', 'o'};
        Reader r(view(in));
        Value v;
        TEST_EXPECT_OK(r.next(v));
        TEST_EXPECT(v == Value{Utf8String{"\xC3\xA9"}});
        TEST_EXPECT_OK(r.next(v));
        TEST_EXPECT(v == Value{PrintableString{"Hello"}});
        const auto *ps = v.get_if<PrintableString>();
        TEST_EXPECT(ps != nullptr &&
                    ps->value.data() == reinterpret_cast<const char *>(in.data() + 6));
    }

    TEST_EXPECT_EC(first_error({0x0C, 0x01, 0xFF}), errc::invalid_utf8);
    TEST_EXPECT_EC(first_error({0x0C, 0x02, 0xC0, 0x80}), errc::invalid_utf8);
    TEST_EXPECT_EC(first_error({0x13, 0x01, '*'}), errc::invalid_printable_string);
    TEST_EXPECT_EC(first_error({0x13, 0x02, 0xC3, 0xA9}), errc::invalid_printable_string);
    TEST_EXPECT_EC(first_error({0x13, 0x03, 'a', '@', 'b'}), errc::invalid_printable_string);
}

void test_unsupported_and_unknown_tags() {
    TEST_EXPECT_EC(first_error({0x03, 0x02, 0x00, 0xFF}), errc::not_implemented);
    TEST_EXPECT_EC(first_error({0x16, 0x01, 'a'}), errc::not_implemented);
    TEST_EXPECT_EC(first_error({0x1E, 0x02, 0x00, 'a'}), errc::not_implemented);

    TEST_EXPECT_EC(first_error({0x09, 0x00}), errc::unrecognized_type);
    TEST_EXPECT_EC(first_error({0xA0, 0x00}), errc::unrecognized_type);
    // tag 之后仍会先解析长度字段。
    TEST_EXPECT_EC(first_error({0x09, 0x80}), errc::indefinite_length);
}

void test_nested_structures() {
    // SEQUENCE { SET { NULL }, BOOLEAN true }
    const std::vector<byte> in{0x30, 0x07, 0x31, 0x02, 0x05, 0x00, 0x01, 0x01, 0xFF};
    Reader r(view(in));
    Value v;

    TEST_EXPECT_OK(r.next(v));
    TEST_EXPECT(v.holds<SequenceStart>());
    TEST_EXPECT_OK(r.next(v));
    TEST_EXPECT(v.holds<SetStart>());
    TEST_EXPECT_EQ(r.depth(), static_cast<std::size_t>(2));
    TEST_EXPECT_OK(r.next(v));
    TEST_EXPECT(v.holds<Null>());
    TEST_EXPECT_OK(r.next(v));
    TEST_EXPECT(v.holds<SetEnd>());
    TEST_EXPECT(v.is_structure_end());
    TEST_EXPECT_EQ(r.depth(), static_cast<std::size_t>(1));
    TEST_EXPECT_OK(r.next(v));
    TEST_EXPECT(v == Value{Boolean{true}});
    TEST_EXPECT_OK(r.next(v));
    TEST_EXPECT(v.holds<SequenceEnd>());
    TEST_EXPECT_EC(r.next(v), errc::end_of_input);
    TEST_EXPECT(r.at_end());

    std::vector<Value> values;
    TEST_EXPECT_EC(read_all({0x30, 0x00, 0x31, 0x00}, values), errc::end_of_input);
    TEST_EXPECT_EQ(values.size(), static_cast<std::size_t>(4));
    if (values.size() == 4) {
        TEST_EXPECT(values[0].holds<SequenceStart>());
        TEST_EXPECT(values[1].holds<SequenceEnd>());
        TEST_EXPECT(values[2].holds<SetStart>());
        TEST_EXPECT(values[3].holds<SetEnd>());
    }
}

void test_structure_bounds() {
    // 内层结构声明长度超出外层剩余空间。
    {
        const std::vector<byte> in{0x30, 0x04, 0x30, 0x05, 0x05, 0x00, 0x05, 0x00};
        Reader r(view(in));
        Value v;
        TEST_EXPECT_OK(r.next(v));
        TEST_EXPECT_EC(r.next(v), errc::end_of_input);
    }
    // 基本类型 payload 越过外层结构末尾：下一次 next() 报告 structure_overrun。
    {
        const std::vector<byte> in{0x30, 0x03, 0x04, 0x02, 0xAA, 0xBB, 0xCC};
        Reader r(view(in));
        Value v;
        TEST_EXPECT_OK(r.next(v));
        TEST_EXPECT_OK(r.next(v));
        TEST_EXPECT(v.holds<OctetString>());
        TEST_EXPECT_EC(r.next(v), errc::structure_overrun);
    }
}

void test_skip_structure() {
    const std::vector<byte> in{0x30, 0x06, 0x01, 0x01, 0x00, 0x01, 0x01, 0xFF, 0x05, 0x00};
    Reader r(view(in));
    Value v;

    TEST_EXPECT_EC(r.skip_structure(), errc::not_in_structure);

    TEST_EXPECT_OK(r.next(v));
    TEST_EXPECT(v.holds<SequenceStart>());
    TEST_EXPECT_OK(r.skip_structure());
    TEST_EXPECT_EQ(r.position(), static_cast<std::size_t>(8));
    TEST_EXPECT_OK(r.next(v));
    TEST_EXPECT(v.holds<SequenceEnd>());
    TEST_EXPECT_OK(r.next(v));
    TEST_EXPECT(v.holds<Null>());
    TEST_EXPECT(r.at_end());
}

void test_max_depth() {
    const std::vector<byte> in{0x30, 0x04, 0x30, 0x02, 0x30, 0x00};

    std::vector<Value> values;
    TEST_EXPECT_EC(read_all(in, values, ReaderOptions{2}), errc::nesting_too_deep);
    TEST_EXPECT_EQ(values.size(), static_cast<std::size_t>(2));

    TEST_EXPECT_EC(read_all(in, values, ReaderOptions{0}), errc::end_of_input);
    TEST_EXPECT_EQ(values.size(), static_cast<std::size_t>(6));

    TEST_EXPECT_EC(read_all(in, values), errc::end_of_input);
    TEST_EXPECT_EQ(values.size(), static_cast<std::size_t>(6));
}

void test_unlimited_depth() {
    constexpr std::size_t kDepth = 1000;

    std::vector<byte> doc;
    for (std::size_t i = 0; i < kDepth; ++i) {
        std::vector<byte> header{0x30};
        const std::size_t len = doc.size();
        if (len <= 0x7F) {
            header.push_back(static_cast<byte>(len));
        } else {
            std::vector<byte> be;
            for (std::size_t v = len; v != 0; v >>= 8) {
                be.insert(be.begin(), static_cast<byte>(v & 0xFF));
            }
            header.push_back(static_cast<byte>(0x80 | be.size()));
            header.insert(header.end(), be.begin(), be.end());
        }
        doc.insert(doc.begin(), header.begin(), header.end());
    }

    std::vector<Value> values;
    TEST_EXPECT_EC(read_all(doc, values, ReaderOptions{0}), errc::end_of_input);
    TEST_EXPECT_EQ(values.size(), 2 * kDepth);
    if (values.size() == 2 * kDepth) {
        TEST_EXPECT(values[kDepth - 1].holds<SequenceStart>());
        TEST_EXPECT(values[kDepth].holds<SequenceEnd>());
    }

    TEST_EXPECT_EC(read_all(doc, values), errc::nesting_too_deep);
    TEST_EXPECT_EQ(values.size(), asn1::der::kDefaultMaxDepth);
}

void test_sample_document_is_deterministic() {
    const auto in = sample_document();

    std::vector<Value> first;
    std::vector<Value> second;
    TEST_EXPECT_EC(read_all(in, first), errc::end_of_input);
    TEST_EXPECT_EC(read_all(in, second), errc::end_of_input);
    TEST_EXPECT_EQ(first.size(), static_cast<std::size_t>(9));
    TEST_EXPECT(first == second);

    if (first.size() == 9) {
        TEST_EXPECT(first[0].holds<SequenceStart>());
        TEST_EXPECT(first[1].holds<SequenceStart>());
        const auto *oid = first[2].get_if<ObjectIdentifier>();
        TEST_EXPECT(oid != nullptr && oid->to_string() == "1.2.840.113549.1.1.1");
        TEST_EXPECT(first[3].holds<Null>());
        TEST_EXPECT(first[4].holds<SequenceEnd>());
        TEST_EXPECT(first[5].holds<SetStart>());
        TEST_EXPECT(first[6] == Value{PrintableString{"Test Corp"}});
        TEST_EXPECT(first[7].holds<SetEnd>());
        TEST_EXPECT(first[8].holds<SequenceEnd>());
    }
}

void test_tag_names() {
    using asn1::der::tag;
    using asn1::der::tag_from_byte;
    using asn1::der::tag_name;

    struct Case {
        tag t;
        byte b;
        std::string_view name;
    };
    const Case cases[] = {
        {tag::boolean, 0x01, "BOOLEAN"},
        {tag::integer, 0x02, "INTEGER"},
        {tag::bit_string, 0x03, "BIT STRING"},
        {tag::octet_string, 0x04, "OCTET STRING"},
        {tag::null, 0x05, "NULL"},
        {tag::object_identifier, 0x06, "OBJECT IDENTIFIER"},
        {tag::utf8_string, 0x0C, "UTF8String"},
        {tag::printable_string, 0x13, "PrintableString"},
        {tag::ia5_string, 0x16, "IA5String"},
        {tag::bmp_string, 0x1E, "BMPString"},
        {tag::sequence, 0x30, "SEQUENCE"},
        {tag::set, 0x31, "SET"},
    };
    for (const auto &c : cases) {
        const char *name = tag_name(c.t);
        TEST_EXPECT(name != nullptr);
        if (name != nullptr) {
            TEST_EXPECT_EQ(std::string_view{name}, c.name);
        }
        const auto parsed = tag_from_byte(c.b);
        TEST_EXPECT(parsed.has_value());
        TEST_EXPECT(parsed == c.t);
    }

    TEST_EXPECT(!tag_from_byte(0x00).has_value());
    TEST_EXPECT(!tag_from_byte(0x10).has_value());
    TEST_EXPECT(!tag_from_byte(0xA0).has_value());
}

}  // namespace

int main() {
    test_sequence_of_booleans();
    test_short_form_length_consumes_exactly();
    test_long_form_lengths();
    test_non_canonical_lengths_rejected();
    test_indefinite_and_overlong_lengths();
    test_truncated_input();
    test_boolean_and_null();
    test_integer();
    test_object_identifier();
    test_strings();
    test_unsupported_and_unknown_tags();
    test_nested_structures();
    test_structure_bounds();
    test_skip_structure();
    test_max_depth();
    test_unlimited_depth();
    test_sample_document_is_deterministic();
    test_tag_names();
    return ::asn1::tests::run_and_report();
}
