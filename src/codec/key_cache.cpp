#include "msgpk/codec/key_cache.hpp"

#include "msgpk/core/utf8.hpp"

#include <cstring>

namespace msgpk {

KeyCache::KeyCache(std::size_t max_key_length, std::size_t max_entries_per_length)
  : max_key_length_(max_key_length),
    max_entries_per_length_(max_entries_per_length),
    buckets_(max_key_length) {}

bool KeyCache::can_be_cached(std::size_t byte_length) const noexcept {
  return byte_length > 0 && byte_length <= max_key_length_ && max_entries_per_length_ > 0;
}

std::size_t KeyCache::size() const noexcept {
  std::size_t total = 0;
  for (const auto& bucket : buckets_) {
    total += bucket.records.size();
  }
  return total;
}

void KeyCache::decode(bytes_view bytes, std::string& out) {
  if (!can_be_cached(bytes.size())) {
    out = core::decode_utf8(bytes);
    return;
  }

  auto& bucket = buckets_[bytes.size() - 1];
  for (const auto& record : bucket.records) {
    if (std::memcmp(record.bytes.data(), bytes.data(), bytes.size()) == 0) {
      ++hits_;
      out = record.text;
      return;
    }
  }

  ++misses_;
  Record record{std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size()),
                core::decode_utf8(bytes)};
  out = record.text;

  if (bucket.records.size() < max_entries_per_length_) {
    bucket.records.push_back(std::move(record));
    return;
  }
  // 桶已满：覆盖最早插入的一条。
  bucket.records[bucket.next_evict] = std::move(record);
  bucket.next_evict = (bucket.next_evict + 1) % max_entries_per_length_;
}

SynchronizedKeyCache::SynchronizedKeyCache(std::size_t max_key_length, std::size_t max_entries_per_length)
  : cache_(max_key_length, max_entries_per_length) {}

bool SynchronizedKeyCache::can_be_cached(std::size_t byte_length) const noexcept {
  // 配置在构造后不变，无需加锁。
  return cache_.can_be_cached(byte_length);
}

void SynchronizedKeyCache::decode(bytes_view bytes, std::string& out) {
  std::lock_guard<std::mutex> lock(mutex_);
  cache_.decode(bytes, out);
}

std::uint64_t SynchronizedKeyCache::hits() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cache_.hits();
}

std::uint64_t SynchronizedKeyCache::misses() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cache_.misses();
}

}  // namespace msgpk
