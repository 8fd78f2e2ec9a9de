#include "msgpk/value/value.hpp"

#include <bit>
#include <type_traits>
#include <utility>
#include <vector>

namespace msgpk {
namespace {

// 浮点比较采用“按位相等”而不是“容差比较”：
// - 编解码关注的是位模式是否一致
// - 这样可以正确处理 NaN、-0/+0 等边界情况
bool double_bits_equal(double a, double b) noexcept {
  return std::bit_cast<std::uint64_t>(a) == std::bit_cast<std::uint64_t>(b);
}

bool object_equal(const ObjectPtr& a, const ObjectPtr& b) noexcept {
  if (a == b) {
    return true;
  }
  if (!a || !b) {
    return false;
  }
  return a->equals(*b);
}

// 判等工作表：待比较的 (lhs, rhs) 子节点对。
using PendingPairs = std::vector<std::pair<const Value*, const Value*>>;

bool push_map_pairs(const Map& lhs, const Map& rhs, PendingPairs& pending) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  // 键唯一（insert_or_assign 保证），因此逐项查找即可判定集合相等。
  for (const auto& entry : lhs) {
    const auto* other = rhs.find(entry.first);
    if (!other) {
      return false;
    }
    pending.emplace_back(&entry.second, other);
  }
  return true;
}

// 比较一对节点的“本层”内容；容器的子节点对压入 pending 留待后续比较。
bool shallow_equal(const Value& lhs, const Value& rhs, PendingPairs& pending) {
  if (lhs.storage().index() != rhs.storage().index()) {
    return false;
  }
  return std::visit(
    [&](const auto& a) -> bool {
      using T = std::decay_t<decltype(a)>;
      const auto& b = *std::get_if<T>(&rhs.storage());
      if constexpr (std::is_same_v<T, double>) {
        return double_bits_equal(a, b);
      } else if constexpr (std::is_same_v<T, ObjectPtr>) {
        return object_equal(a, b);
      } else if constexpr (std::is_same_v<T, Array>) {
        if (a.size() != b.size()) {
          return false;
        }
        for (std::size_t i = 0; i < a.size(); ++i) {
          pending.emplace_back(&a[i], &b[i]);
        }
        return true;
      } else if constexpr (std::is_same_v<T, Map>) {
        return push_map_pairs(a, b, pending);
      } else {
        return a == b;
      }
    },
    lhs.storage());
}

bool drain_equal(PendingPairs& pending) {
  while (!pending.empty()) {
    const auto [lhs, rhs] = pending.back();
    pending.pop_back();
    if (lhs != rhs && !shallow_equal(*lhs, *rhs, pending)) {
      return false;
    }
  }
  return true;
}

[[nodiscard]] bool is_container(const Value& v) noexcept { return v.is_array() || v.is_map(); }

}  // namespace

Map::Map(std::initializer_list<entry_type> entries) {
  entries_.reserve(entries.size());
  for (const auto& entry : entries) {
    insert_or_assign(entry.first, entry.second);
  }
}

std::size_t Map::size() const noexcept { return entries_.size(); }

bool Map::empty() const noexcept { return entries_.empty(); }

void Map::reserve(std::size_t n) { entries_.reserve(n); }

Map::container_type::const_iterator Map::begin() const noexcept { return entries_.begin(); }

Map::container_type::const_iterator Map::end() const noexcept { return entries_.end(); }

std::size_t Map::index_of(const MapKey& key) const noexcept {
  if (!index_.empty()) {
    const auto it = index_.find(key);
    return it == index_.end() ? entries_.size() : it->second;
  }
  for (std::size_t i = 0; i < entries_.size(); ++i) {
    if (entries_[i].first == key) {
      return i;
    }
  }
  return entries_.size();
}

void Map::insert_or_assign(MapKey key, Value value) {
  const auto idx = index_of(key);
  if (idx < entries_.size()) {
    entries_[idx].second = std::move(value);
    return;
  }

  entries_.emplace_back(std::move(key), std::move(value));
  if (!index_.empty()) {
    index_.emplace(entries_.back().first, entries_.size() - 1);
  } else if (entries_.size() >= kIndexThreshold) {
    index_.reserve(entries_.size() * 2);
    for (std::size_t i = 0; i < entries_.size(); ++i) {
      index_.emplace(entries_[i].first, i);
    }
  }
}

const Value* Map::find(const MapKey& key) const noexcept {
  const auto idx = index_of(key);
  return idx < entries_.size() ? &entries_[idx].second : nullptr;
}

const Value* Map::find(std::string_view key) const {
  if (!index_.empty()) {
    return find(MapKey(std::string(key)));
  }
  for (const auto& entry : entries_) {
    const auto* s = entry.first.string_if();
    if (s && *s == key) {
      return &entry.second;
    }
  }
  return nullptr;
}

void Map::release_children(std::vector<Value>& out) {
  for (auto& entry : entries_) {
    if (is_container(entry.second)) {
      out.push_back(std::move(entry.second));
    }
  }
  entries_.clear();
  index_.clear();
}

bool operator==(const Map& lhs, const Map& rhs) {
  PendingPairs pending;
  return push_map_pairs(lhs, rhs, pending) && drain_equal(pending);
}

Value::Value(MapKey key) {
  std::visit([this](auto&& k) { storage_ = std::move(k); }, std::move(key).release());
}

/*
 * 非递归析构：
 * - 把子容器逐层摘到本地工作表，每次只析构一个已被掏空的节点；
 * - 标量子节点随其父容器直接析构。
 * 解码百万层嵌套的输入后销毁结果，调用栈深度保持常数。
 */
Value::~Value() {
  if (!is_container(*this)) {
    return;
  }
  std::vector<Value> pending;
  release_children(pending);
  while (!pending.empty()) {
    Value node = std::move(pending.back());
    pending.pop_back();
    node.release_children(pending);
  }
}

void Value::release_children(std::vector<Value>& out) {
  if (auto* array = std::get_if<Array>(&storage_)) {
    for (auto& child : *array) {
      if (is_container(child)) {
        out.push_back(std::move(child));
      }
    }
    array->clear();
  } else if (auto* map = std::get_if<Map>(&storage_)) {
    map->release_children(out);
  }
}

// 被替换的旧内容交给临时对象，经由上面的非递归析构释放。
Value& Value::operator=(const Value& other) {
  if (this != &other) {
    Value copy(other);
    storage_.swap(copy.storage_);
  }
  return *this;
}

Value& Value::operator=(Value&& other) noexcept {
  Value moved(std::move(other));
  storage_.swap(moved.storage_);
  return *this;
}

bool operator==(const Value& lhs, const Value& rhs) {
  PendingPairs pending{{&lhs, &rhs}};
  return drain_equal(pending);
}

}  // namespace msgpk
