/**
 * @file msgpk_dump.cpp
 * @brief 把一段十六进制 MessagePack 数据解码为可读形式（调试工具）
 *
 * 典型用途：
 * - 从抓包/日志里复制一段十六进制字符串，查看其中的值结构；
 * - 输入可以包含多个首尾相接的顶层值，逐个输出。
 *
 * 运行：
 * - 无参数：编码并输出一个内置示例
 * - 指定输入：./build/examples/msgpk_dump "<hex>" [--multiline] [--no-hex] [--color] [--debug]
 */

#include <msgpk/codec/api.hpp>
#include <msgpk/codec/errc.hpp>
#include <msgpk/codec/timestamp.hpp>
#include <msgpk/core/log.hpp>
#include <msgpk/utils/hex.hpp>
#include <msgpk/utils/value_dump.hpp>

#include <cstddef>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {

[[nodiscard]] bool has_flag(int argc, char **argv, std::string_view flag) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] == flag) {
            return true;
        }
    }
    return false;
}

void print_usage(const char *argv0) {
    std::cout << "用法:\n";
    std::cout << "  " << argv0 << "\n";
    std::cout << "  " << argv0 << " \"<hex>\" [--multiline] [--no-hex] [--color] [--debug]\n";
}

msgpk::Value make_demo_value() {
    msgpk::Map device;
    device.insert_or_assign(msgpk::MapKey("id"), msgpk::Value::integer(1024));
    device.insert_or_assign(msgpk::MapKey("name"), msgpk::Value::string("sensor-7"));
    device.insert_or_assign(msgpk::MapKey("online"), msgpk::Value::boolean(true));
    device.insert_or_assign(msgpk::MapKey("seen"), msgpk::make_timestamp(1700000000, 250000000));
    device.insert_or_assign(
        msgpk::MapKey("samples"),
        msgpk::Value::array({msgpk::Value::floating(21.5), msgpk::Value::floating(21.75),
                             msgpk::Value::nil()}));
    device.insert_or_assign(msgpk::MapKey(42), msgpk::Value::binary({0xca, 0xfe}));
    return msgpk::Value::map(std::move(device));
}

int dump_bytes(const std::vector<msgpk::byte> &bytes,
               const msgpk::utils::ValueDumpOptions &dump_options,
               bool include_hex) {
    if (include_hex) {
        msgpk::utils::HexDumpOptions hex_options;
        hex_options.show_ascii = true;
        hex_options.enable_color = dump_options.enable_color;
        std::cout << msgpk::utils::hex_dump(bytes, hex_options);
    }

    auto values = msgpk::decode_multi(bytes);
    std::size_t index = 0;
    for (const auto &value : values) {
        std::cout << "#" << index++ << " @" << values.offset() << ": "
                  << msgpk::utils::dump_value(value, dump_options) << "\n";
    }
    if (values.error()) {
        std::cerr << "解码失败 @" << values.offset() << ": " << values.error().message()
                  << "\n";
        return 1;
    }
    return 0;
}

} // namespace

int main(int argc, char **argv) {
    if (has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h")) {
        print_usage(argv[0]);
        return 0;
    }
    if (has_flag(argc, argv, "--debug")) {
        msgpk::core::set_log_level(msgpk::core::LogLevel::debug);
    }

    msgpk::utils::ValueDumpOptions dump_options;
    dump_options.multiline = has_flag(argc, argv, "--multiline");
    dump_options.enable_color = has_flag(argc, argv, "--color");
    const bool include_hex = !has_flag(argc, argv, "--no-hex");

    std::vector<msgpk::byte> bytes;
    if (argc < 2 || std::string_view(argv[1]).starts_with("--")) {
        if (auto ec = msgpk::encode(make_demo_value(), bytes); ec) {
            std::cerr << "编码失败: " << ec.message() << "\n";
            return 2;
        }
        std::cout << "内置示例（" << bytes.size() << " 字节）:\n";
    } else if (auto ec = msgpk::utils::parse_hex(argv[1], bytes); ec) {
        std::cerr << "十六进制解析失败: " << ec.message() << "\n";
        print_usage(argv[0]);
        return 2;
    }

    return dump_bytes(bytes, dump_options, include_hex);
}
