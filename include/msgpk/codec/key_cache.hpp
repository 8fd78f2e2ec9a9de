#pragma once

#include "msgpk/value/value.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace msgpk {

/**
 * @brief map 键的字符串解码接口。
 *
 * 解码器在“正在读取 map 键”且 can_be_cached(长度) 为真时，改用该接口解码字符串，
 * 以便对反复出现的短键复用已解码结果（跳过 UTF-8 校验/替换）。
 */
class KeyDecoder {
 public:
  virtual ~KeyDecoder() = default;

  [[nodiscard]] virtual bool can_be_cached(std::size_t byte_length) const noexcept = 0;
  virtual void decode(bytes_view bytes, std::string& out) = 0;
};

/**
 * @brief 按字节内容缓存短键的解码结果。
 *
 * 结构：按键长度分桶（1..max_key_length），每桶最多 max_entries_per_length 条；
 * 桶满后按插入顺序淘汰最旧的一条（环形覆盖）。
 *
 * 注意：
 * - 非线程安全：默认每个解码器实例独占一个 KeyCache；
 * - 需要跨线程共享时使用 SynchronizedKeyCache。
 */
class KeyCache final : public KeyDecoder {
 public:
  static constexpr std::size_t kDefaultMaxKeyLength = 16;
  static constexpr std::size_t kDefaultMaxEntriesPerLength = 16;

  explicit KeyCache(std::size_t max_key_length = kDefaultMaxKeyLength,
                    std::size_t max_entries_per_length = kDefaultMaxEntriesPerLength);

  [[nodiscard]] bool can_be_cached(std::size_t byte_length) const noexcept override;
  void decode(bytes_view bytes, std::string& out) override;

  [[nodiscard]] std::uint64_t hits() const noexcept { return hits_; }
  [[nodiscard]] std::uint64_t misses() const noexcept { return misses_; }
  // 当前缓存的键总数。
  [[nodiscard]] std::size_t size() const noexcept;

 private:
  struct Record final {
    std::string bytes;
    std::string text;
  };

  struct Bucket final {
    std::vector<Record> records;
    std::size_t next_evict{0};
  };

  std::size_t max_key_length_{0};
  std::size_t max_entries_per_length_{0};
  std::vector<Bucket> buckets_;
  std::uint64_t hits_{0};
  std::uint64_t misses_{0};
};

/**
 * @brief 以互斥锁保护的 KeyCache，可在多个线程的解码器之间共享。
 */
class SynchronizedKeyCache final : public KeyDecoder {
 public:
  explicit SynchronizedKeyCache(std::size_t max_key_length = KeyCache::kDefaultMaxKeyLength,
                                std::size_t max_entries_per_length = KeyCache::kDefaultMaxEntriesPerLength);

  [[nodiscard]] bool can_be_cached(std::size_t byte_length) const noexcept override;
  void decode(bytes_view bytes, std::string& out) override;

  [[nodiscard]] std::uint64_t hits() const;
  [[nodiscard]] std::uint64_t misses() const;

 private:
  mutable std::mutex mutex_;
  KeyCache cache_;
};

}  // namespace msgpk
