#pragma once

#include "msgpk/codec/extension.hpp"
#include "msgpk/codec/key_cache.hpp"
#include "msgpk/codec/options.hpp"
#include "msgpk/value/value.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <system_error>
#include <variant>
#include <vector>

namespace msgpk {

/**
 * @brief 解码状态机的输入窗口（只读游标 + 提交点）。
 *
 * - read(n) 从当前位置取 n 字节；不足时返回 insufficient_data，并记录还差多少字节；
 * - commit() 把提交点推进到当前位置：提交点之前的字节已被状态机“吸收”进
 *   帧栈/头字节哨兵，调用方可以安全丢弃；
 * - rollback() 回到提交点：一个值的头部尾随字段（长度、payload）要么整体读完，
 *   要么整体重读，保证暂停/恢复不丢位置。
 */
class InputCursor final {
 public:
  explicit InputCursor(bytes_view in) noexcept : in_(in) {}

  [[nodiscard]] std::size_t remaining() const noexcept { return in_.size() - pos_; }
  [[nodiscard]] std::size_t committed() const noexcept { return committed_; }
  // 最近一次 read 失败时还差的字节数（相对于提交点之后已缓冲的字节）。
  [[nodiscard]] std::size_t shortfall() const noexcept { return shortfall_; }

  std::error_code read(std::size_t n, bytes_view& out) noexcept;
  std::error_code read_u8(byte& out) noexcept;

  void commit() noexcept { committed_ = pos_; }
  void rollback() noexcept { pos_ = committed_; }

 private:
  bytes_view in_{};
  std::size_t pos_{0};
  std::size_t committed_{0};
  std::size_t shortfall_{0};
};

/**
 * @brief Buffer 解码与流式解码共用的 MessagePack 结构状态机。
 *
 * 不使用宿主递归：遇到容器头部时压入一个帧（ArrayFrame/MapFrame），然后回到主循环；
 * 子值完成后沿帧栈向上传播，帧的计数达到声明大小时恰好弹出一次。
 * 因此嵌套深度只消耗堆上的帧栈内存，不受调用栈大小限制。
 *
 * 状态（帧栈 + 头字节哨兵）全部是普通数据：run() 因 insufficient_data 返回后，
 * 补充输入再次调用 run() 即从中断处继续，不会重复推导已解析的结构。
 *
 * 注意：
 * - 非线程安全；同一实例不可被两个解码过程并发使用。
 * - 每个顶层值开始前调用 reset()。
 */
class DecodeMachine final {
 public:
  explicit DecodeMachine(const DecodeOptions& options);

  // 清空帧栈与头字节哨兵（开始一个新的顶层值）。
  void reset() noexcept;

  // 是否处于“刚开始/已完成”的空闲状态（无未完成的帧与头字节）。
  [[nodiscard]] bool idle() const noexcept { return stack_.empty() && !head_byte_.has_value(); }

  [[nodiscard]] std::size_t depth() const noexcept { return stack_.size(); }

  /**
   * @brief 从 in 继续解析，直到得到一个完整的顶层值。
   *
   * 返回：
   * - 成功：out 被赋值，in.committed() 指向该值之后；状态机回到空闲；
   * - insufficient_data：in 已回滚到最后提交点，状态保留，可补充输入后重入；
   * - 其它错误：解析中止，部分结果丢弃（out 不变），需 reset() 后才能继续使用。
   */
  std::error_code run(InputCursor& in, Value& out);

 private:
  struct ArrayFrame final {
    Array array;
    std::uint32_t size{0};
    std::uint32_t position{0};
  };

  struct MapFrame final {
    bool awaiting_value{false};
    std::uint32_t size{0};
    std::uint32_t read_count{0};
    std::optional<MapKey> key;
    Map map;
  };

  using Frame = std::variant<ArrayFrame, MapFrame>;

  enum class Step : std::uint8_t {
    value,      // 得到一个完整的标量（或空容器）
    container,  // 压入了新帧，回到主循环读取第一个子值
  };

  std::error_code read_head(InputCursor& in, byte& head);
  std::error_code dispatch(byte head, InputCursor& in, Value& object, Step& step);

  std::error_code push_array(std::uint32_t size, InputCursor& in, Value& object, Step& step);
  std::error_code push_map(std::uint32_t size, InputCursor& in, Value& object, Step& step);

  std::error_code read_string(std::uint32_t length, InputCursor& in, Value& object);
  std::error_code read_binary(std::uint32_t length, InputCursor& in, Value& object);
  std::error_code read_extension(std::uint32_t length, InputCursor& in, Value& object);

  template <class UInt>
  std::error_code read_uint(InputCursor& in, UInt& out) noexcept;

  // 完成值沿帧栈向上传播；返回 true 表示顶层值完成（object 即结果）。
  std::error_code propagate(Value& object, bool& done);

  [[nodiscard]] bool reading_map_key() const noexcept;

  ExtensionRegistryPtr extensions_;
  std::shared_ptr<KeyDecoder> key_decoder_;

  std::uint32_t max_str_length_;
  std::uint32_t max_bin_length_;
  std::uint32_t max_array_length_;
  std::uint32_t max_map_length_;
  std::uint32_t max_ext_length_;

  std::vector<Frame> stack_;
  // 头字节哨兵：有值表示当前值的头字节已被消费，但其后续字段尚未完整读完。
  std::optional<byte> head_byte_;
};

}  // namespace msgpk
