#include "msgpk/core/buffer.hpp"

#include <algorithm>
#include <cstring>
#include <limits>

namespace msgpk::core {
namespace {

// 按 2 倍增长直到 >= min_capacity（不超过 max_capacity）。
// 返回 0 表示无法满足（溢出或超过上限）。
std::size_t next_capacity(std::size_t current,
                          std::size_t min_capacity,
                          std::size_t max_capacity) noexcept {
    if (min_capacity > max_capacity) {
        return 0;
    }
    std::size_t new_capacity = std::max<std::size_t>(current, 1);
    while (new_capacity < min_capacity) {
        if (new_capacity > (std::numeric_limits<std::size_t>::max() / 2)) {
            return 0;
        }
        new_capacity *= 2;
    }
    return std::min(new_capacity, max_capacity);
}

} // namespace

/*
 * OutputBuffer：编码器的写入目标。
 * - 只追加；容量不够时按 2 倍扩容（搬运已写入部分）。
 * - materialize() 拷贝出 [0, size_) 作为最终结果。
 */
OutputBuffer::OutputBuffer(std::size_t initial_capacity)
    : capacity_(initial_capacity) {
    if (capacity_ != 0) {
        data_ = std::make_unique<byte[]>(capacity_);
    }
}

OutputBuffer::OutputBuffer(OutputBuffer &&other) noexcept
    : data_(std::move(other.data_)), capacity_(other.capacity_),
      size_(other.size_) {
    other.capacity_ = 0;
    other.size_ = 0;
}

OutputBuffer &OutputBuffer::operator=(OutputBuffer &&other) noexcept {
    if (this == &other) {
        return *this;
    }
    data_ = std::move(other.data_);
    capacity_ = other.capacity_;
    size_ = other.size_;
    other.capacity_ = 0;
    other.size_ = 0;
    return *this;
}

std::error_code OutputBuffer::ensure_writable(std::size_t n) noexcept {
    if (capacity_ - size_ >= n) {
        return {};
    }
    if (n > (std::numeric_limits<std::size_t>::max() - size_)) {
        return make_error_code(errc::buffer_overflow);
    }
    const auto new_capacity =
        next_capacity(capacity_, size_ + n, std::numeric_limits<std::size_t>::max());
    if (new_capacity == 0) {
        return make_error_code(errc::buffer_overflow);
    }

    auto new_data = std::make_unique<byte[]>(new_capacity);
    if (size_ != 0) {
        std::memcpy(new_data.get(), data_.get(), size_);
    }
    data_ = std::move(new_data);
    capacity_ = new_capacity;
    return {};
}

std::error_code OutputBuffer::append(bytes_view data) noexcept {
    if (data.empty()) {
        return {};
    }
    auto ec = ensure_writable(data.size());
    if (ec) {
        return ec;
    }
    std::memcpy(data_.get() + size_, data.data(), data.size());
    size_ += data.size();
    return {};
}

std::error_code OutputBuffer::append_byte(byte b) noexcept {
    auto ec = ensure_writable(1);
    if (ec) {
        return ec;
    }
    data_[size_++] = b;
    return {};
}

bytes_view OutputBuffer::view() const noexcept {
    return bytes_view{data_.get(), size_};
}

std::vector<byte> OutputBuffer::materialize() const {
    return std::vector<byte>(data_.get(), data_.get() + size_);
}

/*
 * ScratchBuffer 的实现模型：
 * - 读写指针：read_pos_ / write_pos_ 表示“可读区间”。
 * - ensure_writable(n) 会按顺序尝试：
 *   1) 当前尾部空间是否足够
 *   2) compact() 把可读数据搬到头部，回收前缀空洞
 *   3) grow() 扩容（按 2 倍增长，且受 max_capacity_ 上限约束）
 */
ScratchBuffer::ScratchBuffer(std::size_t initial_capacity, std::size_t max_capacity)
    : max_capacity_(max_capacity),
      capacity_(std::min(initial_capacity, max_capacity)) {
    if (capacity_ != 0) {
        heap_ = std::make_unique<byte[]>(capacity_);
    }
}

ScratchBuffer::ScratchBuffer(ScratchBuffer &&other) noexcept
    : heap_(std::move(other.heap_)), max_capacity_(other.max_capacity_),
      capacity_(other.capacity_), read_pos_(other.read_pos_),
      write_pos_(other.write_pos_) {
    other.max_capacity_ = 0;
    other.capacity_ = 0;
    other.read_pos_ = 0;
    other.write_pos_ = 0;
}

ScratchBuffer &ScratchBuffer::operator=(ScratchBuffer &&other) noexcept {
    if (this == &other) {
        return *this;
    }
    heap_ = std::move(other.heap_);
    max_capacity_ = other.max_capacity_;
    capacity_ = other.capacity_;
    read_pos_ = other.read_pos_;
    write_pos_ = other.write_pos_;

    other.max_capacity_ = 0;
    other.capacity_ = 0;
    other.read_pos_ = 0;
    other.write_pos_ = 0;
    return *this;
}

void ScratchBuffer::clear() noexcept {
    read_pos_ = 0;
    write_pos_ = 0;
}

void ScratchBuffer::compact() noexcept {
    const auto readable = size();
    if (readable == 0) {
        clear();
        return;
    }
    if (read_pos_ == 0) {
        return;
    }
    std::memmove(heap_.get(), heap_.get() + read_pos_, readable);
    read_pos_ = 0;
    write_pos_ = readable;
}

bytes_view ScratchBuffer::readable_bytes() const noexcept {
    return bytes_view{heap_.get() + read_pos_, size()};
}

mutable_bytes_view ScratchBuffer::writable_bytes() noexcept {
    return mutable_bytes_view{heap_.get() + write_pos_, capacity_ - write_pos_};
}

std::error_code ScratchBuffer::commit(std::size_t n) noexcept {
    if (n == 0) {
        return {};
    }
    if (n > (capacity_ - write_pos_)) {
        return make_error_code(errc::invalid_argument);
    }
    write_pos_ += n;
    return {};
}

std::error_code ScratchBuffer::consume(std::size_t n) noexcept {
    if (n == 0) {
        return {};
    }
    if (n > size()) {
        return make_error_code(errc::invalid_argument);
    }
    read_pos_ += n;
    if (read_pos_ == write_pos_) {
        clear();
    }
    return {};
}

std::error_code ScratchBuffer::reserve(std::size_t new_capacity) noexcept {
    if (new_capacity <= capacity_) {
        return {};
    }
    if (new_capacity > max_capacity_) {
        return make_error_code(errc::buffer_overflow);
    }
    return grow(new_capacity);
}

std::error_code ScratchBuffer::ensure_writable(std::size_t n) noexcept {
    if (n == 0) {
        return {};
    }
    if (capacity_ - write_pos_ >= n) {
        return {};
    }

    if (read_pos_ != 0) {
        // 尾部空间不够时，先尝试 compact 回收前缀空洞。
        compact();
        if (capacity_ - write_pos_ >= n) {
            return {};
        }
    }

    const auto readable = size();
    if (n > (std::numeric_limits<std::size_t>::max() - readable)) {
        return make_error_code(errc::buffer_overflow);
    }
    return grow(readable + n);
}

std::error_code ScratchBuffer::grow(std::size_t min_capacity) noexcept {
    if (min_capacity <= capacity_) {
        return {};
    }
    const auto new_capacity = next_capacity(capacity_, min_capacity, max_capacity_);
    if (new_capacity == 0) {
        return make_error_code(errc::buffer_overflow);
    }

    const auto readable = size();
    auto new_heap = std::make_unique<byte[]>(new_capacity);
    if (readable != 0) {
        std::memcpy(new_heap.get(), heap_.get() + read_pos_, readable);
    }
    heap_ = std::move(new_heap);
    capacity_ = new_capacity;
    read_pos_ = 0;
    write_pos_ = readable;
    return {};
}

std::error_code ScratchBuffer::append(bytes_view data) noexcept {
    if (data.empty()) {
        return {};
    }
    auto ec = ensure_writable(data.size());
    if (ec) {
        return ec;
    }
    std::memcpy(heap_.get() + write_pos_, data.data(), data.size());
    write_pos_ += data.size();
    return {};
}

} // namespace msgpk::core
