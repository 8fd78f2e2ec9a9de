#pragma once

#include "msgpk/value/value.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <system_error>
#include <vector>

namespace msgpk {

/**
 * @brief 扩展类型注册表：用户值形态 <-> 8 位有符号 type code 的双向映射。
 *
 * - 编码：按注册顺序依次尝试各编码函数，第一个“认领”该 Object 的函数提供
 *   type code 与 payload；都不认领时编码器报 unsupported_value。
 * - 解码：按 type code 查找解码函数；未注册时报 unsupported_extension。
 *
 * 注意：
 * - 注册阶段非线程安全；注册完成后以 std::shared_ptr<const ExtensionRegistry>
 *   在多个编解码器之间共享只读使用是安全的。
 * - 同一 type code 重复注册会替换旧的处理函数（保留原注册顺序位置）。
 */
class ExtensionRegistry final {
 public:
  // 认领 obj 时返回 payload；不认领返回 std::nullopt。
  using EncodeFn = std::function<std::optional<std::vector<byte>>(const Object& obj)>;
  // 将 payload 解释为 Value；payload 非法时返回 errc::invalid_extension。
  using DecodeFn = std::function<std::error_code(bytes_view payload, std::int8_t type, Value& out)>;

  ExtensionRegistry();

  /**
   * @brief 注册（或替换）一个扩展类型。
   *
   * encode/decode 允许其一为空（仅编码或仅解码）；二者皆空返回 invalid_argument。
   */
  std::error_code register_type(std::int8_t type, EncodeFn encode, DecodeFn decode);

  [[nodiscard]] bool contains(std::int8_t type) const noexcept;
  [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

  [[nodiscard]] std::optional<Extension> encode(const Object& obj) const;
  std::error_code decode(bytes_view payload, std::int8_t type, Value& out) const;

  // 新建一个已注册内建类型（timestamp, type -1）的注册表，可继续注册用户类型。
  [[nodiscard]] static std::shared_ptr<ExtensionRegistry> with_builtins();

  // 只含内建类型的只读注册表（进程内共享；不可变，因此可跨线程使用）。
  [[nodiscard]] static const std::shared_ptr<const ExtensionRegistry>& builtins();

 private:
  struct Entry final {
    std::int8_t type{0};
    EncodeFn encode;
    DecodeFn decode;
  };

  static constexpr std::size_t slot(std::int8_t type) noexcept {
    return static_cast<std::size_t>(static_cast<int>(type) + 128);
  }

  std::vector<Entry> entries_;
  // type code -> entries_ 下标（-1 表示未注册）。
  std::array<std::int16_t, 256> index_{};
};

using ExtensionRegistryPtr = std::shared_ptr<const ExtensionRegistry>;

}  // namespace msgpk
