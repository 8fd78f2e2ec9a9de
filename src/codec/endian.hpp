#pragma once

#include "msgpk/core/common.hpp"

#include <cstddef>
#include <type_traits>

namespace msgpk::detail {

// 大端（网络字节序）读写：MessagePack 所有多字节字段均为大端。
template <class UInt>
inline void store_be(core::byte* dst, UInt v) noexcept {
  static_assert(std::is_unsigned_v<UInt>);
  for (std::size_t i = 0; i < sizeof(UInt); ++i) {
    const auto shift = static_cast<unsigned>(8u * (sizeof(UInt) - 1u - i));
    dst[i] = static_cast<core::byte>((v >> shift) & 0xFFu);
  }
}

template <class UInt>
[[nodiscard]] inline UInt load_be(const core::byte* src) noexcept {
  static_assert(std::is_unsigned_v<UInt>);
  UInt v = 0;
  for (std::size_t i = 0; i < sizeof(UInt); ++i) {
    v = static_cast<UInt>((v << 8) | src[i]);
  }
  return v;
}

}  // namespace msgpk::detail
