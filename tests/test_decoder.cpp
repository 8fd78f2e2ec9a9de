#include "msgpk/codec/api.hpp"
#include "msgpk/codec/decoder.hpp"
#include "msgpk/codec/errc.hpp"
#include "msgpk/codec/key_cache.hpp"
#include "msgpk/utils/hex.hpp"

#include "test_main.hpp"

#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace {

using msgpk::DecodeOptions;
using msgpk::Extension;
using msgpk::Map;
using msgpk::MapKey;
using msgpk::Value;
using msgpk::byte;
using msgpk::errc;

std::vector<byte> hex(std::string_view text) {
  std::vector<byte> out;
  TEST_EXPECT_OK(msgpk::utils::parse_hex(text, out));
  return out;
}

std::error_code decode_hex(std::string_view text, Value& out, const DecodeOptions& options = {}) {
  const auto bytes = hex(text);
  return msgpk::decode(bytes, out, options);
}

void test_scalars() {
  Value v;
  TEST_EXPECT_OK(decode_hex("c0", v));
  TEST_EXPECT(v.is_nil());
  TEST_EXPECT_OK(decode_hex("c3", v));
  TEST_EXPECT_EQ(v, Value::boolean(true));
  TEST_EXPECT_OK(decode_hex("ff", v));
  TEST_EXPECT_EQ(v, Value::integer(-1));
  TEST_EXPECT_OK(decode_hex("d0 df", v));
  TEST_EXPECT_EQ(v, Value::integer(-33));
  TEST_EXPECT_OK(decode_hex("cd 01 00", v));
  TEST_EXPECT_EQ(v, Value::integer(256));
  TEST_EXPECT_OK(decode_hex("cb 3f f8 00 00 00 00 00 00", v));
  TEST_EXPECT_EQ(v, Value::floating(1.5));
  TEST_EXPECT_OK(decode_hex("a5 68 65 6c 6c 6f", v));
  TEST_EXPECT_EQ(v, Value::string("hello"));
  TEST_EXPECT_OK(decode_hex("c4 02 01 02", v));
  TEST_EXPECT_EQ(v, Value::binary({1, 2}));
}

void test_integer_normalization_on_decode() {
  Value v;
  // uint64 格式承载的小值归一化为 int64。
  TEST_EXPECT_OK(decode_hex("cf 00 00 00 00 00 00 00 05", v));
  TEST_EXPECT(v.get_if<std::int64_t>() != nullptr);
  TEST_EXPECT_EQ(v, Value::integer(5));

  TEST_EXPECT_OK(decode_hex("cf ff ff ff ff ff ff ff ff", v));
  TEST_EXPECT(v.get_if<std::uint64_t>() != nullptr);
  TEST_EXPECT_EQ(v, Value::integer(std::numeric_limits<std::uint64_t>::max()));

  TEST_EXPECT_OK(decode_hex("d3 80 00 00 00 00 00 00 00", v));
  TEST_EXPECT_EQ(v, Value::integer(std::numeric_limits<std::int64_t>::min()));
}

void test_float32_is_widened() {
  Value v;
  TEST_EXPECT_OK(decode_hex("ca 3f c0 00 00", v));
  TEST_EXPECT(v.get_if<double>() != nullptr);
  TEST_EXPECT_EQ(v, Value::floating(1.5));
}

void test_containers() {
  Value v;
  TEST_EXPECT_OK(decode_hex("93 01 02 03", v));
  TEST_EXPECT_EQ(v, Value::array({Value::integer(1), Value::integer(2), Value::integer(3)}));

  TEST_EXPECT_OK(decode_hex("81 a1 61 01", v));
  TEST_EXPECT_EQ(v, Value::map(Map{{MapKey("a"), Value::integer(1)}}));

  TEST_EXPECT_OK(decode_hex("90", v));
  TEST_EXPECT_EQ(v, Value::array({}));
  TEST_EXPECT_OK(decode_hex("80", v));
  TEST_EXPECT_EQ(v, Value::map(Map{}));

  // [{}, [[]], {"k": []}]
  TEST_EXPECT_OK(decode_hex("93 80 91 90 81 a1 6b 90", v));
  TEST_EXPECT_EQ(v, Value::array({Value::map(Map{}), Value::array({Value::array({})}),
                                  Value::map(Map{{MapKey("k"), Value::array({})}})}));

  // array 16 / map 16 形式
  TEST_EXPECT_OK(decode_hex("dc 00 02 c2 c3", v));
  TEST_EXPECT_EQ(v, Value::array({Value::boolean(false), Value::boolean(true)}));
  TEST_EXPECT_OK(decode_hex("de 00 01 01 a1 78", v));
  TEST_EXPECT_EQ(v, Value::map(Map{{MapKey(1), Value::string("x")}}));
}

void test_round_trip() {
  Map inner;
  inner.insert_or_assign(MapKey("name"), Value::string("msgpk"));
  inner.insert_or_assign(MapKey(-7), Value::binary({0xde, 0xad}));
  inner.insert_or_assign(MapKey("nested"),
                         Value::array({Value::nil(), Value::floating(-0.0), Value::string(std::string(40, 'z'))}));
  const auto original = Value::array({
    Value::integer(std::numeric_limits<std::int64_t>::min()),
    Value::integer(std::numeric_limits<std::uint64_t>::max()),
    Value::map(inner),
    Value::extension(3, {9, 9, 9}),
  });

  std::vector<byte> wire;
  TEST_EXPECT_OK(msgpk::encode(original, wire));

  // 透传解码 type 3 的扩展。
  auto registry = msgpk::ExtensionRegistry::with_builtins();
  TEST_EXPECT_OK(registry->register_type(3, nullptr, [](msgpk::bytes_view payload, std::int8_t type, Value& out) {
    out = Value::extension(type, std::vector<byte>(payload.begin(), payload.end()));
    return std::error_code{};
  }));
  DecodeOptions options;
  options.extensions = registry;

  Value decoded;
  TEST_EXPECT_OK(msgpk::decode(wire, decoded, options));
  TEST_EXPECT_EQ(decoded, original);
}

void test_duplicate_keys_last_wins() {
  Value v;
  TEST_EXPECT_OK(decode_hex("83 a1 61 01 a1 62 02 a1 61 03", v));
  const auto* map = v.get_if<Map>();
  TEST_EXPECT(map != nullptr);
  if (map) {
    TEST_EXPECT_EQ(map->size(), 2u);
    TEST_EXPECT_EQ(*map->find("a"), Value::integer(3));
    TEST_EXPECT_EQ(*map->begin()->first.string_if(), std::string("a"));
  }
}

void test_forbidden_key() {
  Value v = Value::string("untouched");
  TEST_EXPECT_EQ(decode_hex("81 a9 5f 5f 70 72 6f 74 6f 5f 5f 01", v), errc::forbidden_key);
  TEST_EXPECT_EQ(v, Value::string("untouched"));

  // 作为值出现时不受限制。
  TEST_EXPECT_OK(decode_hex("81 a1 6b a9 5f 5f 70 72 6f 74 6f 5f 5f", v));
  TEST_EXPECT_OK(decode_hex("a9 5f 5f 70 72 6f 74 6f 5f 5f", v));

  // 关闭键缓存时同样拒绝。
  DecodeOptions options;
  options.use_key_cache = false;
  TEST_EXPECT_EQ(decode_hex("81 a9 5f 5f 70 72 6f 74 6f 5f 5f 01", v, options), errc::forbidden_key);
}

void test_invalid_map_keys() {
  Value v;
  TEST_EXPECT_EQ(decode_hex("81 c0 01", v), errc::invalid_map_key);
  TEST_EXPECT_EQ(decode_hex("81 cb 3f f8 00 00 00 00 00 00 01", v), errc::invalid_map_key);
  TEST_EXPECT_EQ(decode_hex("81 90 01", v), errc::invalid_map_key);
  TEST_EXPECT_EQ(decode_hex("81 c4 00 01", v), errc::invalid_map_key);
}

void test_length_limits() {
  Value v;
  DecodeOptions options;
  options.max_str_length = 3;
  options.max_bin_length = 2;
  options.max_array_length = 2;
  options.max_map_length = 1;
  options.max_ext_length = 1;

  TEST_EXPECT_OK(decode_hex("a3 61 62 63", v, options));
  TEST_EXPECT_EQ(decode_hex("a4 61 62 63 64", v, options), errc::length_exceeded);
  TEST_EXPECT_EQ(decode_hex("c4 03 01 02 03", v, options), errc::length_exceeded);
  TEST_EXPECT_EQ(decode_hex("93 01 02 03", v, options), errc::length_exceeded);
  TEST_EXPECT_EQ(decode_hex("82 01 01 02 02", v, options), errc::length_exceeded);
  TEST_EXPECT_EQ(decode_hex("d5 05 01 02", v, options), errc::length_exceeded);

  // 超限判定发生在读取 payload 之前：即使 payload 缺失也报 length_exceeded。
  TEST_EXPECT_EQ(decode_hex("db 00 00 10 00", v, options), errc::length_exceeded);
  TEST_EXPECT_EQ(decode_hex("dd ff ff ff ff", v, options), errc::length_exceeded);
}

void test_huge_declared_sizes_do_not_preallocate() {
  Value v;
  // 默认上限下，声明 4G 个元素但没有数据：只会得到 insufficient_data。
  TEST_EXPECT_EQ(decode_hex("dd ff ff ff ff", v), errc::insufficient_data);
  TEST_EXPECT_EQ(decode_hex("df ff ff ff ff", v), errc::insufficient_data);
  TEST_EXPECT_EQ(decode_hex("c6 ff ff ff ff 00", v), errc::insufficient_data);
}

void test_insufficient_data() {
  Value v = Value::integer(99);
  TEST_EXPECT_EQ(msgpk::decode(std::vector<byte>{}, v), errc::insufficient_data);
  TEST_EXPECT_EQ(decode_hex("92 01", v), errc::insufficient_data);
  TEST_EXPECT_EQ(decode_hex("d9 05 61", v), errc::insufficient_data);
  TEST_EXPECT_EQ(decode_hex("cd 01", v), errc::insufficient_data);
  TEST_EXPECT_EQ(decode_hex("81 a1 61", v), errc::insufficient_data);
  TEST_EXPECT_EQ(v, Value::integer(99));
  TEST_EXPECT(!msgpk::is_decode_error(msgpk::make_error_code(errc::insufficient_data)));
}

void test_extra_bytes() {
  Value v;
  TEST_EXPECT_EQ(decode_hex("c0 c0", v), errc::extra_bytes);
  TEST_EXPECT_EQ(decode_hex("93 01 02 03 04", v), errc::extra_bytes);
}

void test_invalid_header() {
  Value v;
  TEST_EXPECT_EQ(decode_hex("c1", v), errc::invalid_header);
  TEST_EXPECT_EQ(decode_hex("92 01 c1", v), errc::invalid_header);
  TEST_EXPECT(msgpk::is_decode_error(msgpk::make_error_code(errc::invalid_header)));
}

void test_extensions() {
  Value v;
  TEST_EXPECT_EQ(decode_hex("d4 05 aa", v), errc::unsupported_extension);

  auto registry = std::make_shared<msgpk::ExtensionRegistry>();
  TEST_EXPECT_OK(registry->register_type(5, nullptr, [](msgpk::bytes_view payload, std::int8_t type, Value& out) {
    out = Value::extension(type, std::vector<byte>(payload.begin(), payload.end()));
    return std::error_code{};
  }));
  DecodeOptions options;
  options.extensions = registry;

  TEST_EXPECT_OK(decode_hex("d4 05 aa", v, options));
  TEST_EXPECT_EQ(v, Value::extension(5, {0xaa}));
  TEST_EXPECT_OK(decode_hex("c7 00 05", v, options));
  TEST_EXPECT_EQ(v, Value::extension(5, {}));
  TEST_EXPECT_OK(decode_hex("c8 00 03 05 01 02 03", v, options));
  TEST_EXPECT_EQ(v, Value::extension(5, {1, 2, 3}));

  // 自建注册表不含时间戳。
  TEST_EXPECT_EQ(decode_hex("d6 ff 00 00 00 01", v, options), errc::unsupported_extension);
  // 默认注册表含时间戳。
  TEST_EXPECT_OK(decode_hex("d6 ff 00 00 00 01", v));
}

void test_deep_nesting_uses_heap_frames() {
  constexpr std::size_t kDepth = 10000;
  std::vector<byte> wire(kDepth, 0x91);
  wire.push_back(0xc0);

  Value v;
  TEST_EXPECT_OK(msgpk::decode(wire, v));

  std::size_t depth = 0;
  const Value* cursor = &v;
  while (const auto* array = cursor->get_if<msgpk::Array>()) {
    ++depth;
    cursor = &array->front();
  }
  TEST_EXPECT_EQ(depth, kDepth);
  TEST_EXPECT(cursor->is_nil());
}

// 百万层嵌套：解码、判等、销毁都不能消耗与深度成正比的调用栈。
void test_million_level_nesting_is_destroyed_iteratively() {
  constexpr std::size_t kDepth = 1000000;
  std::vector<byte> wire(kDepth, 0x91);
  wire.push_back(0xc0);

  {
    Value v;
    TEST_EXPECT_OK(msgpk::decode(wire, v));
    TEST_EXPECT(v.is_array());

    Value again;
    TEST_EXPECT_OK(msgpk::decode(wire, again));
    TEST_EXPECT(again == v);

    // 覆盖一个深层值：旧内容同样需要非递归释放。
    again = Value::nil();
    TEST_EXPECT(again != v);
    again = std::move(v);
    TEST_EXPECT(again.is_array());
  }

  // 多出一个字节：解码器内部丢弃已完成的深层结果后报 extra_bytes。
  wire.push_back(0xc0);
  Value untouched = Value::integer(7);
  TEST_EXPECT_EQ(msgpk::decode(wire, untouched), errc::extra_bytes);
  TEST_EXPECT_EQ(untouched, Value::integer(7));

  // map 值方向的深层嵌套。
  constexpr std::size_t kMapDepth = 200000;
  std::vector<byte> map_wire;
  map_wire.reserve(kMapDepth * 2 + 1);
  for (std::size_t i = 0; i < kMapDepth; ++i) {
    map_wire.push_back(0x81);
    map_wire.push_back(0x01);
  }
  map_wire.push_back(0xc0);
  Value nested_map;
  TEST_EXPECT_OK(msgpk::decode(map_wire, nested_map));
  TEST_EXPECT(nested_map.is_map());
}

void test_decode_one_reports_consumed() {
  msgpk::Decoder decoder;
  const auto wire = hex("92 01 02 c3");
  Value v;
  std::size_t consumed = 0;
  TEST_EXPECT_OK(decoder.decode_one(wire, v, consumed));
  TEST_EXPECT_EQ(consumed, 3u);

  // 同一实例在出错之后仍可继续使用。
  TEST_EXPECT_EQ(decoder.decode(hex("c1"), v), errc::invalid_header);
  TEST_EXPECT_OK(decoder.decode(hex("c3"), v));
  TEST_EXPECT_EQ(v, Value::boolean(true));
}

void test_multi_decode_in_order() {
  const auto wire = hex("01 a1 62 93 01 02 03");
  auto multi = msgpk::decode_multi(wire);

  Value v;
  TEST_EXPECT_OK(multi.next(v));
  TEST_EXPECT_EQ(v, Value::integer(1));
  TEST_EXPECT_OK(multi.next(v));
  TEST_EXPECT_EQ(v, Value::string("b"));
  TEST_EXPECT_OK(multi.next(v));
  TEST_EXPECT_EQ(v, Value::array({Value::integer(1), Value::integer(2), Value::integer(3)}));
  TEST_EXPECT_EQ(multi.next(v), errc::end_of_data);
  TEST_EXPECT_EQ(multi.offset(), wire.size());
  TEST_EXPECT(!multi.error());
}

void test_multi_decode_range_for() {
  const auto wire = hex("c0 c2 c3");
  std::vector<Value> values;
  auto multi = msgpk::decode_multi(wire);
  for (const auto& v : multi) {
    values.push_back(v);
  }
  TEST_EXPECT_EQ(values.size(), 3u);
  TEST_EXPECT(!multi.error());

  std::vector<Value> none;
  auto empty = msgpk::decode_multi(msgpk::bytes_view{});
  for (const auto& v : empty) {
    none.push_back(v);
  }
  TEST_EXPECT(none.empty());
}

void test_multi_decode_stops_on_error() {
  const auto wire = hex("01 c1 02");
  auto multi = msgpk::decode_multi(wire);
  std::vector<Value> values;
  for (const auto& v : multi) {
    values.push_back(v);
  }
  TEST_EXPECT_EQ(values.size(), 1u);
  TEST_EXPECT_EQ(multi.error(), errc::invalid_header);

  // 末尾截断的值报 insufficient_data 而不是 end_of_data。
  const auto truncated = hex("01 92 01");
  auto tail = msgpk::decode_multi(truncated);
  Value v;
  TEST_EXPECT_OK(tail.next(v));
  TEST_EXPECT_EQ(tail.next(v), errc::insufficient_data);
}

void test_shared_key_cache_through_options() {
  auto cache = std::make_shared<msgpk::KeyCache>();
  DecodeOptions options;
  options.key_decoder = cache;

  const auto wire = hex("82 a2 69 64 01 a4 6e 61 6d 65 a1 78");
  Value first;
  Value second;
  TEST_EXPECT_OK(msgpk::decode(wire, first, options));
  TEST_EXPECT_OK(msgpk::decode(wire, second, options));
  TEST_EXPECT_EQ(first, second);
  TEST_EXPECT_EQ(cache->misses(), 2u);
  TEST_EXPECT_EQ(cache->hits(), 2u);

  // 值位置上的字符串不走键缓存。
  TEST_EXPECT_OK(msgpk::decode(hex("a2 69 64"), first, options));
  TEST_EXPECT_EQ(cache->hits(), 2u);
}

}  // namespace

int main() {
  test_scalars();
  test_integer_normalization_on_decode();
  test_float32_is_widened();
  test_containers();
  test_round_trip();
  test_duplicate_keys_last_wins();
  test_forbidden_key();
  test_invalid_map_keys();
  test_length_limits();
  test_huge_declared_sizes_do_not_preallocate();
  test_insufficient_data();
  test_extra_bytes();
  test_invalid_header();
  test_extensions();
  test_deep_nesting_uses_heap_frames();
  test_million_level_nesting_is_destroyed_iteratively();
  test_decode_one_reports_consumed();
  test_multi_decode_in_order();
  test_multi_decode_range_for();
  test_multi_decode_stops_on_error();
  test_shared_key_cache_through_options();
  return ::msgpk::tests::run_and_report();
}
