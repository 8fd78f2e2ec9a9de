#pragma once

#include "msgpk/codec/extension.hpp"
#include "msgpk/codec/key_cache.hpp"
#include "msgpk/core/common.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>

namespace msgpk {

inline constexpr std::size_t kDefaultMaxDepth = 100;

struct EncodeOptions final {
    // 扩展类型注册表；为空时使用 ExtensionRegistry::builtins()。
    ExtensionRegistryPtr extensions{};

    // 最大嵌套深度（顶层值深度为 1，每进入一层 Array/Map 加 1）。
    std::size_t max_depth{kDefaultMaxDepth};

    // 输出缓冲区初始容量（不足时按 2 倍扩容）。
    std::size_t initial_buffer_size{core::kDefaultBufferCapacity};

    // 能无损表示为 float32 的浮点数改用 float 32 格式（0xca）输出。
    bool force_float32{false};
};

struct DecodeOptions final {
    // 扩展类型注册表；为空时使用 ExtensionRegistry::builtins()。
    ExtensionRegistryPtr extensions{};

    // 流式解码暂存区初始容量；只增不减。
    std::size_t stream_buffer_size{core::kDefaultBufferCapacity};

    // 流式解码暂存区容量上限（超过时返回 core::errc::buffer_overflow）。
    std::size_t max_stream_buffer_size{core::kUnboundedCapacity};

    // 各类声明长度的上限：超过即报 length_exceeded，且发生在任何按该长度分配内存之前。
    std::uint32_t max_str_length{core::kMaxWireLength};
    std::uint32_t max_bin_length{core::kMaxWireLength};
    std::uint32_t max_array_length{core::kMaxWireLength};
    std::uint32_t max_map_length{core::kMaxWireLength};
    std::uint32_t max_ext_length{core::kMaxWireLength};

    // map 键解码缓存。为空且 use_key_cache 为真时，每个解码器实例自建一个 KeyCache；
    // 跨线程共享时请传入 SynchronizedKeyCache。
    std::shared_ptr<KeyDecoder> key_decoder{};
    bool use_key_cache{true};
};

} // namespace msgpk
