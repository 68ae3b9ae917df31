/**
 * @file der_dump.cpp
 * @brief 演示 asn1::utils 的十六进制解析与 DER 结构化输出
 *
 * 运行：
 * - 无参数：输出内置示例（一个证书 Name 片段）
 * - 指定输入（将十六进制字符串整体作为一个参数传入）：
 *   - ./build/examples/der_dump "<hex>" [--no-hex] [--no-color] [--debug]
 */

#include <asn1/core/log.hpp>
#include <asn1/utils/hex.hpp>
#include <asn1/utils/value_dump.hpp>

#include <iostream>
#include <string>
#include <string_view>
#include <vector>

using namespace asn1;

namespace {

constexpr std::string_view kBuiltinSample =
    "30 2b 31 0b 30 09 06 03 55 04 06 13 02 43 4e"
    "31 1c 30 1a 06 03 55 04 03 0c 13 e7 a4 ba e4 be"
    "8b e8 af 81 e4 b9 a6 20 28 44 45 4d 4f 29";

[[nodiscard]] bool has_flag(int argc, char **argv, std::string_view flag) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] == flag) {
            return true;
        }
    }
    return false;
}

[[nodiscard]] std::string_view first_positional(int argc, char **argv) {
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg.rfind("--", 0) != 0) {
            return arg;
        }
    }
    return kBuiltinSample;
}

} // namespace

int main(int argc, char **argv) {
    if (has_flag(argc, argv, "--help")) {
        std::cout << "用法:\n  " << argv[0]
                  << " [\"<hex>\"] [--no-hex] [--no-color] [--debug]\n";
        return 0;
    }

    core::set_log_level(has_flag(argc, argv, "--debug") ? core::LogLevel::debug
                                                         : core::LogLevel::warn);
    const bool color = !has_flag(argc, argv, "--no-color");

    std::vector<core::byte> bytes;
    if (auto ec = utils::parse_hex(first_positional(argc, argv), bytes)) {
        std::cerr << "hex 解析失败: " << ec.message() << "\n";
        return 2;
    }
    const core::bytes_view view{bytes.data(), bytes.size()};

    if (!has_flag(argc, argv, "--no-hex")) {
        utils::HexDumpOptions hex_opt;
        hex_opt.show_ascii = true;
        hex_opt.enable_color = color;
        std::cout << utils::hex_dump(view, hex_opt) << "\n";
    }

    utils::ValueDumpOptions opt;
    opt.enable_color = color;
    std::string out;
    const auto ec = utils::dump_values(view, out, opt);
    std::cout << out;
    if (ec) {
        std::cerr << "DER 解码失败: " << ec.message() << "\n";
        return 1;
    }
    return 0;
}
