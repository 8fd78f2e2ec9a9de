#pragma once

#include "msgpk/codec/extension.hpp"
#include "msgpk/codec/options.hpp"
#include "msgpk/core/buffer.hpp"
#include "msgpk/value/value.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <system_error>

namespace msgpk {

/**
 * @brief MessagePack 编码器：深度优先遍历 Value，把头字节与 payload 追加到 OutputBuffer。
 *
 * 格式选择：
 * - 整数：选择能精确表示该值的最短形式（fixint / uint8..64 / int8..64）；
 * - 浮点：float 64（force_float32 时，可无损表示的值用 float 32）；
 * - str/bin/array/map：按长度选择 fix / 8 / 16 / 32 位长度前缀形式；
 * - Extension：payload 长度为 1/2/4/8/16 时用 fixext，否则 ext 8/16/32；
 * - Object：交给扩展注册表；无人认领时返回 unsupported_value。
 *
 * 失败时 out 中可能残留部分写入的字节，调用方应丢弃。
 */
class Encoder final {
 public:
  explicit Encoder(const EncodeOptions& options = {});

  // depth 为 value 所在的嵌套层级（顶层为 1）；超过 max_depth 返回 depth_exceeded。
  std::error_code encode(core::OutputBuffer& out, const Value& value, std::size_t depth = 1) const;

 private:
  std::error_code encode_nil(core::OutputBuffer& out) const;
  std::error_code encode_boolean(core::OutputBuffer& out, bool v) const;
  std::error_code encode_signed(core::OutputBuffer& out, std::int64_t v) const;
  std::error_code encode_unsigned(core::OutputBuffer& out, std::uint64_t v) const;
  std::error_code encode_float(core::OutputBuffer& out, double v) const;
  std::error_code encode_string(core::OutputBuffer& out, std::string_view s) const;
  std::error_code encode_binary(core::OutputBuffer& out, bytes_view data) const;
  std::error_code encode_array(core::OutputBuffer& out, const Array& array, std::size_t depth) const;
  std::error_code encode_map(core::OutputBuffer& out, const Map& map, std::size_t depth) const;
  std::error_code encode_map_key(core::OutputBuffer& out, const MapKey& key) const;
  std::error_code encode_extension(core::OutputBuffer& out, const Extension& ext) const;
  std::error_code encode_object(core::OutputBuffer& out, const Object& obj) const;

  ExtensionRegistryPtr extensions_;
  std::size_t max_depth_{kDefaultMaxDepth};
  bool force_float32_{false};
};

}  // namespace msgpk
