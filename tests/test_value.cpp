#include "msgpk/value/value.hpp"

#include "test_main.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

namespace {

using msgpk::Map;
using msgpk::MapKey;
using msgpk::Value;

void test_integer_normalization() {
  const auto small_unsigned = Value::integer(std::uint64_t{42});
  TEST_EXPECT(small_unsigned.get_if<std::int64_t>() != nullptr);
  TEST_EXPECT_EQ(small_unsigned, Value::integer(42));

  const auto max_signed = Value::integer(static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()));
  TEST_EXPECT(max_signed.get_if<std::int64_t>() != nullptr);

  const auto big = Value::integer(std::numeric_limits<std::uint64_t>::max());
  TEST_EXPECT(big.get_if<std::uint64_t>() != nullptr);
  TEST_EXPECT(big.is_integer());

  TEST_EXPECT_EQ(Value::integer(std::int8_t{-5}), Value::integer(std::int64_t{-5}));
  TEST_EXPECT_EQ(MapKey(std::uint32_t{7}), MapKey(7));
}

void test_kind_predicates() {
  TEST_EXPECT(Value().is_nil());
  TEST_EXPECT(Value::nil().is_nil());
  TEST_EXPECT(Value::string("x").is_string());
  TEST_EXPECT(Value::array({}).is_array());
  TEST_EXPECT(Value::map(Map{}).is_map());
  TEST_EXPECT(!Value::boolean(false).is_nil());
}

void test_distinct_kinds_are_not_equal() {
  TEST_EXPECT(Value::integer(0) != Value::boolean(false));
  TEST_EXPECT(Value::integer(1) != Value::floating(1.0));
  TEST_EXPECT(Value::string("") != Value::binary({}));
  TEST_EXPECT(Value::nil() != Value::array({}));
}

void test_float_equality_is_bitwise() {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  TEST_EXPECT_EQ(Value::floating(nan), Value::floating(nan));
  TEST_EXPECT(Value::floating(0.0) != Value::floating(-0.0));
  TEST_EXPECT_EQ(Value::floating(1.5), Value::floating(1.5));
}

void test_map_insert_or_assign_last_wins_in_place() {
  Map map;
  map.insert_or_assign(MapKey("a"), Value::integer(1));
  map.insert_or_assign(MapKey("b"), Value::integer(2));
  map.insert_or_assign(MapKey("a"), Value::integer(3));

  TEST_EXPECT_EQ(map.size(), 2u);
  auto it = map.begin();
  TEST_EXPECT_EQ(*it->first.string_if(), std::string("a"));
  TEST_EXPECT_EQ(it->second, Value::integer(3));
  ++it;
  TEST_EXPECT_EQ(*it->first.string_if(), std::string("b"));
}

void test_map_equality_ignores_order() {
  Map ab{{MapKey("a"), Value::integer(1)}, {MapKey("b"), Value::integer(2)}};
  Map ba{{MapKey("b"), Value::integer(2)}, {MapKey("a"), Value::integer(1)}};
  TEST_EXPECT(ab == ba);

  Map different{{MapKey("a"), Value::integer(1)}, {MapKey("b"), Value::integer(9)}};
  TEST_EXPECT(!(ab == different));
}

void test_map_string_and_integer_keys_are_distinct() {
  Map map;
  map.insert_or_assign(MapKey("1"), Value::string("text"));
  map.insert_or_assign(MapKey(1), Value::string("number"));
  TEST_EXPECT_EQ(map.size(), 2u);
  TEST_EXPECT_EQ(*map.find("1"), Value::string("text"));
  TEST_EXPECT_EQ(*map.find(MapKey(1)), Value::string("number"));
  TEST_EXPECT(map.find("missing") == nullptr);
}

void test_large_map_uses_index() {
  Map map;
  for (int i = 0; i < 100; ++i) {
    map.insert_or_assign(MapKey("k" + std::to_string(i)), Value::integer(i));
  }
  for (int i = 0; i < 100; i += 2) {
    map.insert_or_assign(MapKey("k" + std::to_string(i)), Value::integer(-i));
  }
  TEST_EXPECT_EQ(map.size(), 100u);
  TEST_EXPECT_EQ(*map.find("k42"), Value::integer(-42));
  TEST_EXPECT_EQ(*map.find("k43"), Value::integer(43));
  TEST_EXPECT(map.find("k100") == nullptr);

  // 插入顺序在建立索引后仍保持不变。
  std::size_t position = 0;
  for (const auto& [key, value] : map) {
    TEST_EXPECT_EQ(*key.string_if(), "k" + std::to_string(position));
    ++position;
  }
}

void test_nested_equality() {
  const auto lhs = Value::array({Value::integer(1), Value::map(Map{{MapKey("x"), Value::array({})}})});
  const auto rhs = Value::array({Value::integer(1), Value::map(Map{{MapKey("x"), Value::array({})}})});
  TEST_EXPECT_EQ(lhs, rhs);

  const auto other = Value::array({Value::integer(1), Value::map(Map{{MapKey("x"), Value::nil()}})});
  TEST_EXPECT(lhs != other);
}

void test_value_from_map_key() {
  TEST_EXPECT_EQ(Value(MapKey("k")), Value::string("k"));
  TEST_EXPECT_EQ(Value(MapKey(-3)), Value::integer(-3));
}

}  // namespace

int main() {
  test_integer_normalization();
  test_kind_predicates();
  test_distinct_kinds_are_not_equal();
  test_float_equality_is_bitwise();
  test_map_insert_or_assign_last_wins_in_place();
  test_map_equality_ignores_order();
  test_map_string_and_integer_keys_are_distinct();
  test_large_map_uses_index();
  test_nested_equality();
  test_value_from_map_key();
  return ::msgpk::tests::run_and_report();
}
