#pragma once

#include <system_error>

namespace msgpk {

/**
 * @brief 编解码错误码。
 *
 * 分类：
 * - 解码错误（输入非法或违反策略）：invalid_header / invalid_map_key / forbidden_key /
 *   length_exceeded / unsupported_extension / invalid_extension / extra_bytes；
 * - insufficient_data：输入“暂时不够”，不是“输入非法”；流式调用方据此决定继续拉取；
 * - end_of_data：多值解码时输入恰好在值边界处耗尽（正常结束）；
 * - 编码错误：depth_exceeded / unsupported_value / length_overflow。
 */
enum class errc : int {
  ok = 0,
  insufficient_data = 1,
  invalid_header = 2,
  invalid_map_key = 3,
  forbidden_key = 4,
  length_exceeded = 5,
  unsupported_extension = 6,
  invalid_extension = 7,
  extra_bytes = 8,
  end_of_data = 9,
  depth_exceeded = 10,
  unsupported_value = 11,
  length_overflow = 12,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

// 是否属于“解码错误”（输入非法）。insufficient_data 与 end_of_data 不算。
[[nodiscard]] bool is_decode_error(const std::error_code& ec) noexcept;

}  // namespace msgpk

namespace std {
template <>
struct is_error_code_enum<msgpk::errc> : true_type {};
}  // namespace std
