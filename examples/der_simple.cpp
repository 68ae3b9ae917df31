#include <asn1/der/reader.hpp>

#include <iostream>
#include <vector>

using namespace asn1::der;

int main() {
    std::cout << "=== DER 流式解码简单示例 ===\n\n";

    // SEQUENCE { OID 1.2.840.113549.1.1.11, NULL, UTF8String "héllo" }
    const std::vector<byte> encoded{
        0x30, 0x15,
        0x06, 0x09, 0x2A, 0x86, 0x48, 0x86, 0xF7, 0x0D, 0x01, 0x01, 0x0B,
        0x05, 0x00,
        0x0C, 0x06, 'h', 0xC3, 0xA9, 'l', 'l', 'o',
    };

    Reader reader(bytes_view{encoded.data(), encoded.size()});
    Value value;
    std::error_code ec;
    while (!(ec = reader.next(value))) {
        if (value.holds<SequenceStart>()) {
            std::cout << "SEQUENCE 开始\n";
        } else if (value.holds<SequenceEnd>()) {
            std::cout << "SEQUENCE 结束\n";
        } else if (const auto *oid = value.get_if<ObjectIdentifier>()) {
            std::cout << "  OID: " << oid->to_string() << "\n";
        } else if (value.holds<Null>()) {
            std::cout << "  NULL\n";
        } else if (const auto *s = value.get_if<Utf8String>()) {
            std::cout << "  UTF8String: " << s->value << "\n";
        }
    }

    // 正常结束：顶层 end_of_input 且没有未闭合的结构。
    if (ec != errc::end_of_input || !reader.at_end()) {
        std::cerr << "解码失败: " << ec.message() << "\n";
        return 1;
    }
    std::cout << "\n解码完成，共消费 " << reader.position() << " 字节\n";
    return 0;
}
