#pragma once

#include "msgpk/core/common.hpp"
#include "msgpk/core/error.hpp"

#include <cstddef>
#include <memory>
#include <system_error>
#include <vector>

namespace msgpk::core {

/**
 * @brief 只写、可扩容的输出字节缓冲区（编码器唯一的写入目标）。
 *
 * 设计目标：
 * - 容量不足时按 2 倍扩容，摊还每次 append 的拷贝成本；
 * - 从不收缩；clear() 只重置长度，保留已分配内存供下一次编码复用；
 * - materialize() 返回“恰好已写入部分”的独立副本。
 *
 * 注意：
 * - 本类不做线程安全保证；一次编码过程独占一个缓冲区。
 */
class OutputBuffer final {
public:
    explicit OutputBuffer(std::size_t initial_capacity = kDefaultBufferCapacity);

    OutputBuffer(OutputBuffer &&other) noexcept;
    OutputBuffer &operator=(OutputBuffer &&other) noexcept;

    OutputBuffer(const OutputBuffer &) = delete;
    OutputBuffer &operator=(const OutputBuffer &) = delete;

    ~OutputBuffer() = default;

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] std::size_t size() const noexcept { return size_; }
    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }

    void clear() noexcept { size_ = 0; }

    std::error_code append(bytes_view data) noexcept;
    std::error_code append_byte(byte b) noexcept;

    [[nodiscard]] bytes_view view() const noexcept;
    [[nodiscard]] std::vector<byte> materialize() const;

private:
    std::error_code ensure_writable(std::size_t n) noexcept;

    std::unique_ptr<byte[]> data_;
    std::size_t capacity_{0};
    std::size_t size_{0};
};

/**
 * @brief 流式解码使用的输入暂存区（读写指针模型）。
 *
 * 语义：
 * - [read_pos_, write_pos_) 为“已拉取但尚未被解码器提交消费”的字节；
 * - 拉取源通过 writable_bytes() + commit() 原地写入，避免额外拷贝；
 * - 空间不足时先 compact() 回收前缀空洞，再按 2 倍 grow()；
 * - 容量只增不减：同一个解码器实例在多次解码之间复用已分配的内存。
 *
 * 注意：
 * - 本类不做线程安全保证。
 */
class ScratchBuffer final {
public:
    explicit ScratchBuffer(std::size_t initial_capacity = kDefaultBufferCapacity,
                           std::size_t max_capacity = kUnboundedCapacity);

    ScratchBuffer(ScratchBuffer &&other) noexcept;
    ScratchBuffer &operator=(ScratchBuffer &&other) noexcept;

    ScratchBuffer(const ScratchBuffer &) = delete;
    ScratchBuffer &operator=(const ScratchBuffer &) = delete;

    ~ScratchBuffer() = default;

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] std::size_t size() const noexcept { return write_pos_ - read_pos_; }
    [[nodiscard]] bool empty() const noexcept { return size() == 0; }

    void clear() noexcept;
    void compact() noexcept;

    [[nodiscard]] bytes_view readable_bytes() const noexcept;
    [[nodiscard]] mutable_bytes_view writable_bytes() noexcept;

    std::error_code commit(std::size_t n) noexcept;
    std::error_code append(bytes_view data) noexcept;
    std::error_code consume(std::size_t n) noexcept;
    std::error_code reserve(std::size_t new_capacity) noexcept;

    // 保证尾部至少有 n 字节可写（必要时 compact/grow）。
    std::error_code ensure_writable(std::size_t n) noexcept;

private:
    std::error_code grow(std::size_t min_capacity) noexcept;

    std::unique_ptr<byte[]> heap_;

    std::size_t max_capacity_{0};
    std::size_t capacity_{0};
    std::size_t read_pos_{0};
    std::size_t write_pos_{0};
};

} // namespace msgpk::core
