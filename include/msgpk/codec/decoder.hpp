#pragma once

#include "msgpk/codec/decode_machine.hpp"
#include "msgpk/codec/options.hpp"
#include "msgpk/value/value.hpp"

#include <cstddef>
#include <iterator>
#include <system_error>

namespace msgpk {

/**
 * @brief 内存驻留（整块 buffer）解码器。
 *
 * 与 StreamDecoder 共用同一个 DecodeMachine；区别只在于字节来源：
 * 这里的“读取 N 字节”就是对固定 buffer 的边界检查，不足即 insufficient_data。
 *
 * 注意：
 * - 帧栈等内部状态在多次 decode 之间复用；同一实例不可并发使用。
 */
class Decoder final {
 public:
  explicit Decoder(const DecodeOptions& options = {});

  /**
   * @brief 解码 in 中恰好一个值。
   *
   * 失败时：
   * - 输入为空或被截断：insufficient_data
   * - 值之后还有多余字节：extra_bytes
   * - 其它非法输入：见 msgpk::errc
   * out 仅在成功时被赋值。
   */
  std::error_code decode(bytes_view in, Value& out);

  /**
   * @brief 从 in 开头解码一个值（允许其后还有数据）。
   *
   * 成功时 consumed 为该值占用的字节数；失败时 consumed 为 0。
   */
  std::error_code decode_one(bytes_view in, Value& out, std::size_t& consumed);

 private:
  DecodeMachine machine_;
};

/**
 * @brief 多值解码：把一个 buffer 视为若干个顶层值首尾相接的序列，惰性逐个解码。
 *
 * 用法：
 * - next(out) 逐个取值；buffer 恰好在值边界耗尽时返回 end_of_data；
 * - 或使用 range-for 遍历，遇到错误时停止，可通过 error() 查询原因。
 *
 * 注意：
 * - 只引用（不拷贝）输入 buffer，调用方需保证其生命周期；
 * - 序列不可重启：需要重新遍历时构造新的 MultiDecoder。
 */
class MultiDecoder final {
 public:
  MultiDecoder(bytes_view in, const DecodeOptions& options = {});

  std::error_code next(Value& out);

  [[nodiscard]] std::size_t offset() const noexcept { return offset_; }
  [[nodiscard]] const std::error_code& error() const noexcept { return error_; }

  class iterator final {
   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Value;
    using difference_type = std::ptrdiff_t;
    using pointer = const Value*;
    using reference = const Value&;

    iterator() = default;

    reference operator*() const noexcept { return current_; }
    pointer operator->() const noexcept { return &current_; }

    iterator& operator++();
    void operator++(int) { ++*this; }

    friend bool operator==(const iterator& lhs, const iterator& rhs) noexcept {
      return lhs.owner_ == rhs.owner_;
    }

   private:
    friend class MultiDecoder;
    explicit iterator(MultiDecoder* owner) : owner_(owner) { ++*this; }

    MultiDecoder* owner_{nullptr};
    Value current_{};
  };

  [[nodiscard]] iterator begin() { return iterator(this); }
  [[nodiscard]] iterator end() noexcept { return iterator(); }

 private:
  bytes_view in_{};
  std::size_t offset_{0};
  std::error_code error_{};
  Decoder decoder_;
};

}  // namespace msgpk
