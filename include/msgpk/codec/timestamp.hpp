#pragma once

#include "msgpk/codec/extension.hpp"
#include "msgpk/value/value.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace msgpk {

// MessagePack 规范保留的时间戳扩展类型。
inline constexpr std::int8_t kTimestampType = -1;

/**
 * @brief 时间戳（自 Unix 纪元起的秒 + 纳秒），内建扩展类型 -1。
 *
 * 线上形态（按能容纳的最短形式选择）：
 * - timestamp 32：nanoseconds == 0 且 0 <= seconds < 2^32，4 字节无符号秒；
 * - timestamp 64：0 <= seconds < 2^34，高 30 位纳秒 + 低 34 位秒；
 * - timestamp 96：4 字节纳秒 + 8 字节有符号秒。
 */
class Timestamp final : public Object {
 public:
  Timestamp(std::int64_t seconds, std::uint32_t nanoseconds) noexcept
    : seconds_(seconds), nanoseconds_(nanoseconds) {}

  [[nodiscard]] std::int64_t seconds() const noexcept { return seconds_; }
  [[nodiscard]] std::uint32_t nanoseconds() const noexcept { return nanoseconds_; }

  [[nodiscard]] bool equals(const Object& other) const noexcept override;
  [[nodiscard]] std::string describe() const override;

 private:
  std::int64_t seconds_{0};
  std::uint32_t nanoseconds_{0};
};

[[nodiscard]] Value make_timestamp(std::int64_t seconds, std::uint32_t nanoseconds = 0);

// nanoseconds >= 1e9 的时间戳不可表示，返回 invalid_extension。
std::error_code encode_timestamp(const Timestamp& ts, std::vector<byte>& out);
std::error_code decode_timestamp(bytes_view payload, std::int64_t& seconds, std::uint32_t& nanoseconds) noexcept;

// 在 registry 上注册 kTimestampType 的编解码函数。
std::error_code register_timestamp(ExtensionRegistry& registry);

}  // namespace msgpk
