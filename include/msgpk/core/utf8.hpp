#pragma once

#include "msgpk/core/common.hpp"

#include <string>

namespace msgpk::core {

/**
 * @brief UTF-8 字节序列 -> std::string。
 *
 * 说明：
 * - 合法输入按字节原样拷贝（快路径）；
 * - 非法序列（截断、过长编码、代理区、超出 U+10FFFF）逐个替换为 U+FFFD，
 *   与常见“非严格”文本解码器的行为一致，解码本身不会失败。
 */
[[nodiscard]] std::string decode_utf8(bytes_view bytes);

// 若 bytes 是合法 UTF-8，返回 bytes.size()；否则返回第一个非法序列的偏移。
[[nodiscard]] std::size_t utf8_valid_prefix(bytes_view bytes) noexcept;

}  // namespace msgpk::core
