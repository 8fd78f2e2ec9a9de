#pragma once

#include "msgpk/core/common.hpp"

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace msgpk {

using byte = core::byte;
using bytes_view = core::bytes_view;
using mutable_bytes_view = core::mutable_bytes_view;

class Value;
using Array = std::vector<Value>;

struct Nil final {
  friend bool operator==(const Nil&, const Nil&) = default;
};

struct Binary final {
  std::vector<byte> value;
  friend bool operator==(const Binary&, const Binary&) = default;
};

/**
 * @brief 未经扩展注册表解释的原始扩展数据（type code + payload）。
 *
 * 编码时原样输出为 fixext/ext；解码时只有注册了“透传”处理函数的类型
 * 才会得到该形态（见 ExtensionRegistry）。
 */
struct Extension final {
  std::int8_t type{0};
  std::vector<byte> data;
  friend bool operator==(const Extension&, const Extension&) = default;
};

/**
 * @brief 用户自定义值形态的基类。
 *
 * MessagePack 内建格式无法表达的值（例如时间戳、业务对象）以 Object 的
 * 形式放入 Value；编码器只能通过 ExtensionRegistry 中注册的编码函数序列化它，
 * 找不到匹配的编码函数时报 unsupported_value。
 */
class Object {
 public:
  virtual ~Object() = default;

  // 判等：仅在 other 与 *this 为同一具体类型且内容相同时返回 true。
  [[nodiscard]] virtual bool equals(const Object& other) const noexcept = 0;

  // 可读描述（调试/日志用途）。
  [[nodiscard]] virtual std::string describe() const = 0;
};

using ObjectPtr = std::shared_ptr<const Object>;

/**
 * @brief Map 的键：只允许字符串或整数。
 *
 * 整数键与 Value 一样做归一化：能放进 int64 的一律以 int64 存储。
 */
class MapKey final {
 public:
  using storage_type = std::variant<std::string, std::int64_t, std::uint64_t>;

  explicit MapKey(std::string s) : storage_(std::move(s)) {}
  explicit MapKey(const char* s) : storage_(std::string(s)) {}

  template <std::integral T>
    requires(!std::same_as<T, bool>)
  explicit MapKey(T v) : storage_(normalize(v)) {}

  [[nodiscard]] const storage_type& storage() const noexcept { return storage_; }

  [[nodiscard]] bool is_string() const noexcept {
    return std::holds_alternative<std::string>(storage_);
  }
  [[nodiscard]] bool is_integer() const noexcept { return !is_string(); }

  [[nodiscard]] const std::string* string_if() const noexcept {
    return std::get_if<std::string>(&storage_);
  }

  [[nodiscard]] storage_type release() && { return std::move(storage_); }

  friend bool operator==(const MapKey&, const MapKey&) = default;

 private:
  template <class T>
  static storage_type normalize(T v) {
    if constexpr (std::is_signed_v<T>) {
      return static_cast<std::int64_t>(v);
    } else if (static_cast<std::uint64_t>(v) <=
               static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
      return static_cast<std::int64_t>(v);
    } else {
      return static_cast<std::uint64_t>(v);
    }
  }

  storage_type storage_;
};

struct MapKeyHash final {
  std::size_t operator()(const MapKey& key) const noexcept {
    return std::hash<MapKey::storage_type>{}(key.storage());
  }
};

/**
 * @brief MessagePack map：按插入顺序保存键值对。
 *
 * 约定：
 * - 编码时按插入顺序输出；
 * - insert_or_assign 遇到已存在的键时原位替换值（保持原有位置，后写者胜）；
 * - 判等忽略顺序：键集合相同且每个键对应的值相等；
 * - 条目数达到 kIndexThreshold 后建立哈希索引，避免大 map 逐个插入退化为 O(n^2)。
 */
class Map final {
 public:
  using entry_type = std::pair<MapKey, Value>;
  using container_type = std::vector<entry_type>;

  static constexpr std::size_t kIndexThreshold = 16;

  Map() = default;
  Map(std::initializer_list<entry_type> entries);

  [[nodiscard]] std::size_t size() const noexcept;
  [[nodiscard]] bool empty() const noexcept;

  void reserve(std::size_t n);

  void insert_or_assign(MapKey key, Value value);

  [[nodiscard]] const Value* find(const MapKey& key) const noexcept;
  [[nodiscard]] const Value* find(std::string_view key) const;

  [[nodiscard]] container_type::const_iterator begin() const noexcept;
  [[nodiscard]] container_type::const_iterator end() const noexcept;

  friend bool operator==(const Map& lhs, const Map& rhs);

 private:
  friend class Value;

  [[nodiscard]] std::size_t index_of(const MapKey& key) const noexcept;

  // 把值为容器的条目移入 out，并清空本 map（供 Value 的非递归析构使用）。
  void release_children(std::vector<Value>& out);

  container_type entries_;
  // 键 -> entries_ 下标；小 map 为空，按线性查找。
  std::unordered_map<MapKey, std::size_t, MapKeyHash> index_;
};

/**
 * @brief MessagePack 值（强类型 tagged union，支持嵌套 Array/Map）。
 *
 * 约定：
 * - 整数：能放进 int64 的一律存为 int64；只有大于 INT64_MAX 的无符号值存为 uint64；
 * - 浮点：统一为 double（float32 在解码时提升）；判等按位比较（NaN 与自身相等，+0 != -0）；
 * - 字符串：UTF-8 字节序列，std::string 承载；
 * - Object：用户自定义形态，只能经由扩展注册表编码。
 *
 * 析构与判等不使用递归：嵌套深度只受堆内存限制，与解码器一致。
 */
class Value final {
 public:
  using storage_type = std::variant<Nil,
                                    bool,
                                    std::int64_t,
                                    std::uint64_t,
                                    double,
                                    std::string,
                                    Binary,
                                    Array,
                                    Map,
                                    Extension,
                                    ObjectPtr>;

  Value() = default;
  ~Value();

  Value(const Value&) = default;
  Value(Value&&) noexcept = default;
  Value& operator=(const Value& other);
  Value& operator=(Value&& other) noexcept;

  explicit Value(Nil) {}
  explicit Value(bool v) : storage_(v) {}
  explicit Value(double v) : storage_(v) {}
  explicit Value(std::string v) : storage_(std::move(v)) {}
  explicit Value(Binary v) : storage_(std::move(v)) {}
  explicit Value(Array v) : storage_(std::move(v)) {}
  explicit Value(Map v) : storage_(std::move(v)) {}
  explicit Value(Extension v) : storage_(std::move(v)) {}
  explicit Value(ObjectPtr v) : storage_(std::move(v)) {}
  explicit Value(MapKey key);

  [[nodiscard]] const storage_type& storage() const noexcept { return storage_; }
  [[nodiscard]] storage_type& storage() noexcept { return storage_; }

  template <class T>
  [[nodiscard]] const T* get_if() const noexcept {
    return std::get_if<T>(&storage_);
  }

  template <class T>
  [[nodiscard]] T* get_if() noexcept {
    return std::get_if<T>(&storage_);
  }

  [[nodiscard]] bool is_nil() const noexcept { return std::holds_alternative<Nil>(storage_); }
  [[nodiscard]] bool is_integer() const noexcept {
    return std::holds_alternative<std::int64_t>(storage_) ||
           std::holds_alternative<std::uint64_t>(storage_);
  }
  [[nodiscard]] bool is_string() const noexcept {
    return std::holds_alternative<std::string>(storage_);
  }
  [[nodiscard]] bool is_array() const noexcept { return std::holds_alternative<Array>(storage_); }
  [[nodiscard]] bool is_map() const noexcept { return std::holds_alternative<Map>(storage_); }

  static Value nil() { return Value{}; }
  static Value boolean(bool v) { return Value(v); }

  template <std::integral T>
    requires(!std::same_as<T, bool>)
  static Value integer(T v) {
    Value out;
    if constexpr (std::is_signed_v<T>) {
      out.storage_ = static_cast<std::int64_t>(v);
    } else if (static_cast<std::uint64_t>(v) <=
               static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
      out.storage_ = static_cast<std::int64_t>(v);
    } else {
      out.storage_ = static_cast<std::uint64_t>(v);
    }
    return out;
  }

  static Value floating(double v) { return Value(v); }
  static Value string(std::string v) { return Value(std::move(v)); }
  static Value binary(std::vector<byte> v) { return Value(Binary{std::move(v)}); }
  static Value array(std::vector<Value> v) { return Value(Array(std::move(v))); }
  static Value map(Map v) { return Value(std::move(v)); }
  static Value extension(std::int8_t type, std::vector<byte> data) {
    return Value(Extension{type, std::move(data)});
  }
  static Value object(ObjectPtr v) { return Value(std::move(v)); }

  friend bool operator==(const Value& lhs, const Value& rhs);
  friend bool operator!=(const Value& lhs, const Value& rhs) { return !(lhs == rhs); }

 private:
  // 把直接子节点中的容器移入 out（标量子节点原地析构即可）。
  void release_children(std::vector<Value>& out);

  storage_type storage_;
};

}  // namespace msgpk
