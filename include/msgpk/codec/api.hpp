#pragma once

#include "msgpk/codec/decoder.hpp"
#include "msgpk/codec/encoder.hpp"
#include "msgpk/codec/options.hpp"
#include "msgpk/codec/stream_decoder.hpp"
#include "msgpk/value/value.hpp"

#include <asio/awaitable.hpp>

#include <system_error>
#include <utility>
#include <vector>

namespace msgpk {

/**
 * @brief 便捷入口：一次性编码/解码。
 *
 * 每次调用都会构造一个新的编码器/解码器（含各自的键缓存）；
 * 高频场景建议直接持有 Encoder/Decoder/StreamDecoder 实例复用内部状态。
 */

// 编码 value 并追加到 out 末尾；失败时 out 保持调用前的内容。
std::error_code encode(const Value& value, std::vector<byte>& out, const EncodeOptions& options = {});

// 解码 in 中恰好一个值（尾随字节报 extra_bytes）。
std::error_code decode(bytes_view in, Value& out, const DecodeOptions& options = {});

// 惰性解码 in 中首尾相接的多个值。
[[nodiscard]] MultiDecoder decode_multi(bytes_view in, const DecodeOptions& options = {});

// 从同步拉取源解码一个值。
std::error_code decode_stream(PullSource& source, Value& out, const DecodeOptions& options = {});

// 从协程拉取源解码一个值；options 按值传入，协程挂起期间仍然有效。
asio::awaitable<std::pair<std::error_code, Value>> async_decode_stream(AsyncPullSource& source,
                                                                       DecodeOptions options = {});

}  // namespace msgpk
