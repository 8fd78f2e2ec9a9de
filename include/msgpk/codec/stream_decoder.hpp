#pragma once

#include "msgpk/codec/decode_machine.hpp"
#include "msgpk/codec/options.hpp"
#include "msgpk/core/buffer.hpp"
#include "msgpk/value/value.hpp"

#include <asio/awaitable.hpp>

#include <cstddef>
#include <system_error>
#include <utility>

namespace msgpk {

/**
 * @brief 同步拉取源：每次调用把不超过 dst.size() 的字节写入 dst。
 *
 * 约定：
 * - n == 0 表示数据源已耗尽；
 * - 返回非零 error_code 表示底层读取失败（原样向上传递）。
 */
class PullSource {
 public:
  virtual ~PullSource() = default;

  virtual std::error_code read_some(mutable_bytes_view dst, std::size_t& n) = 0;
};

/**
 * @brief 协程拉取源（asio awaitable），语义同 PullSource。
 *
 * 返回 asio::error::eof 或 n == 0 都视为数据源耗尽。
 * socket/文件/管道到该接口的适配由业务侧提供。
 */
class AsyncPullSource {
 public:
  virtual ~AsyncPullSource() = default;

  virtual asio::awaitable<std::pair<std::error_code, std::size_t>>
  async_read_some(mutable_bytes_view dst) = 0;
};

/**
 * @brief 流式解码器：与 Decoder 相同的状态机，字节来自按需调用的拉取源。
 *
 * 语义：
 * - 状态机需要的字节多于已缓冲字节时暂停，向拉取源要数据（可能多次、每次只给一部分），
 *   凑够后从暂停处继续，不重复解析已完成的结构；
 * - 拉取源在凑够之前耗尽：返回 insufficient_data（与“输入非法”的解码错误相区分）；
 * - 暂存区按 2 倍增长、在实例生命周期内只增不减；
 * - 一次拉取多出的字节保留在暂存区，供同一实例的下一次 decode 使用，
 *   因此对同一个源反复调用 decode 即可按序取出多个顶层值。
 *
 * 注意：
 * - 非线程安全；同一实例不可同时进行两个 decode。
 * - 放弃一个进行中的 async_decode（不再恢复该协程）即为取消，实例随后可直接销毁。
 */
class StreamDecoder final {
 public:
  explicit StreamDecoder(const DecodeOptions& options = {});

  std::error_code decode(PullSource& source, Value& out);

  asio::awaitable<std::pair<std::error_code, Value>> async_decode(AsyncPullSource& source);

  // 暂存区中尚未被解码消费的字节数。
  [[nodiscard]] std::size_t buffered_size() const noexcept { return scratch_.size(); }
  [[nodiscard]] std::size_t buffer_capacity() const noexcept { return scratch_.capacity(); }

  // 上一次 decode 之后既无缓冲字节、也无解析到一半的值：
  // 拉取源此时返回耗尽即为“正常结束”，而不是截断。
  [[nodiscard]] bool at_boundary() const noexcept { return scratch_.empty() && machine_.idle(); }

 private:
  // 用暂存区中已有字节推进状态机；need 返回还需要拉取的最少字节数。
  std::error_code step(Value& out, std::size_t& need);

  // 为至少 need 字节腾出可写空间。
  std::error_code prepare_pull(std::size_t need, mutable_bytes_view& dst);

  DecodeMachine machine_;
  core::ScratchBuffer scratch_;
};

}  // namespace msgpk
