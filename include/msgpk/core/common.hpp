#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>

namespace msgpk::core {

using byte = std::uint8_t;
using bytes_view = std::span<const byte>;
using mutable_bytes_view = std::span<byte>;

// OutputBuffer / ScratchBuffer 默认初始容量：与常见小消息大小匹配，减少早期扩容次数。
inline constexpr std::size_t kDefaultBufferCapacity = 2048;

// ScratchBuffer 默认最大容量：不额外设限，由各长度上限（max_*_length）约束单次读取。
inline constexpr std::size_t kUnboundedCapacity = std::numeric_limits<std::size_t>::max();

// 所有长度字段的上限（MessagePack 最宽的长度字段为 32 位）。
inline constexpr std::uint32_t kMaxWireLength = std::numeric_limits<std::uint32_t>::max();

}  // 命名空间 msgpk::core
