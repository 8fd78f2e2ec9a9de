#pragma once

#include <system_error>

namespace msgpk::core {

/**
 * @brief 底层基础设施（缓冲区等）的通用错误码。
 *
 * 约定：
 * - 本库所有接口优先返回 std::error_code，避免异常路径。
 * - 编解码语义相关的错误见 msgpk::errc（codec/errc.hpp）。
 */
enum class errc : int {
  ok = 0,
  buffer_overflow = 1,
  invalid_argument = 2,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace msgpk::core

namespace std {
template <>
struct is_error_code_enum<msgpk::core::errc> : true_type {};
}  // namespace std
