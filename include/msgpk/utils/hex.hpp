#pragma once

#include "msgpk/core/common.hpp"
#include "msgpk/core/error.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace msgpk::utils {

/**
 * @brief 16 进制解析/格式化工具。
 *
 * 典型使用场景：
 * - 测试里用 "93 01 02 03" 这样的字面量描述期望的编码结果；
 * - 解码失败时把原始输入以 hexdump 形式写进日志，便于定位出错的头字节。
 */

struct HexDumpOptions final {
    // 每行字节数（0 按 16 处理）。
    std::size_t bytes_per_line{16};

    // 输出的最大字节数（0 表示不限制）。超出部分会打印截断提示。
    std::size_t max_bytes{256};

    // 是否输出行首偏移（0000:）。
    bool show_offset{true};

    // 是否输出 ASCII 侧栏（仅展示可打印字符，其余用 '.'）。
    bool show_ascii{false};

    // 是否输出 ANSI 颜色控制码（写入日志/文件时建议关闭）。
    bool enable_color{false};
};

[[nodiscard]] std::string hex_dump(core::bytes_view bytes, HexDumpOptions options = {});

// 紧凑形式："c0 93 01"（无偏移、无换行），适合单行日志。
[[nodiscard]] std::string to_hex(core::bytes_view bytes);

/**
 * @brief 解析 16 进制字符串为 bytes（追加前清空 out）。
 *
 * 支持大小写 hex、常见分隔符（空白 , ; : - _ | 与括号），
 * 以及每组数字前可选的 0x/0X 前缀。
 *
 * 失败返回 core::errc::invalid_argument（非法字符或奇数个 nibble）。
 */
std::error_code parse_hex(std::string_view text, std::vector<core::byte> &out) noexcept;

} // namespace msgpk::utils
