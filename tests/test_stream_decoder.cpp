#include "msgpk/codec/api.hpp"
#include "msgpk/codec/errc.hpp"
#include "msgpk/codec/stream_decoder.hpp"
#include "msgpk/core/error.hpp"
#include "msgpk/utils/hex.hpp"

#include "test_main.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/error.hpp>
#include <asio/io_context.hpp>
#include <asio/post.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>

#include <algorithm>
#include <array>
#include <string>
#include <utility>
#include <vector>

namespace {

using msgpk::DecodeOptions;
using msgpk::Map;
using msgpk::MapKey;
using msgpk::StreamDecoder;
using msgpk::Value;
using msgpk::byte;
using msgpk::errc;
using msgpk::mutable_bytes_view;

using DecodeResult = std::pair<std::error_code, Value>;

std::vector<byte> hex(std::string_view text) {
  std::vector<byte> out;
  TEST_EXPECT_OK(msgpk::utils::parse_hex(text, out));
  return out;
}

// 每次最多交付 chunk 字节的内存数据源。
class ChunkedSource final : public msgpk::PullSource {
 public:
  ChunkedSource(std::vector<byte> data, std::size_t chunk) : data_(std::move(data)), chunk_(chunk) {}

  std::error_code read_some(mutable_bytes_view dst, std::size_t& n) override {
    ++calls_;
    n = std::min({chunk_, dst.size(), data_.size() - pos_});
    std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(pos_), n, dst.begin());
    pos_ += n;
    return {};
  }

  [[nodiscard]] std::size_t calls() const noexcept { return calls_; }
  [[nodiscard]] std::size_t delivered() const noexcept { return pos_; }

 private:
  std::vector<byte> data_;
  std::size_t chunk_;
  std::size_t pos_{0};
  std::size_t calls_{0};
};

class FailingSource final : public msgpk::PullSource {
 public:
  std::error_code read_some(mutable_bytes_view dst, std::size_t& n) override {
    if (!dst.empty()) {
      dst[0] = 0x92;  // 先给一个数组头，之后失败
    }
    n = first_ ? 1 : 0;
    if (first_) {
      first_ = false;
      return {};
    }
    return std::make_error_code(std::errc::io_error);
  }

 private:
  bool first_{true};
};

// 协程版本：每次读取前让出一次执行权，模拟真实的异步 I/O。
class AsyncChunkedSource final : public msgpk::AsyncPullSource {
 public:
  AsyncChunkedSource(std::vector<byte> data, std::size_t chunk, bool report_eof)
    : data_(std::move(data)), chunk_(chunk), report_eof_(report_eof) {}

  asio::awaitable<std::pair<std::error_code, std::size_t>> async_read_some(mutable_bytes_view dst) override {
    co_await asio::post(co_await asio::this_coro::executor, asio::use_awaitable);
    const auto n = std::min({chunk_, dst.size(), data_.size() - pos_});
    if (n == 0 && report_eof_) {
      co_return std::pair<std::error_code, std::size_t>{asio::error::eof, 0};
    }
    std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(pos_), n, dst.begin());
    pos_ += n;
    co_return std::pair<std::error_code, std::size_t>{std::error_code{}, n};
  }

 private:
  std::vector<byte> data_;
  std::size_t chunk_;
  std::size_t pos_{0};
  bool report_eof_{false};
};

template <class Start>
DecodeResult run_async(Start&& start) {
  asio::io_context ioc;
  DecodeResult result{};
  bool done = false;
  asio::co_spawn(
    ioc,
    [&]() -> asio::awaitable<void> {
      result = co_await start();
      done = true;
      co_return;
    },
    asio::detached);
  ioc.run();
  TEST_EXPECT(done);
  return result;
}

Value sample_value() {
  Map map;
  map.insert_or_assign(MapKey("id"), Value::integer(70000));
  map.insert_or_assign(MapKey("tags"), Value::array({Value::string("a"), Value::string(std::string(300, 't'))}));
  map.insert_or_assign(MapKey(-2), Value::binary(std::vector<byte>(70, 0x5a)));
  map.insert_or_assign(MapKey("pi"), Value::floating(3.14159));
  return Value::array({Value::map(map), Value::nil(), Value::integer(-129), Value::array({})});
}

std::vector<byte> sample_wire() {
  std::vector<byte> wire;
  TEST_EXPECT_OK(msgpk::encode(sample_value(), wire));
  return wire;
}

void test_one_byte_chunks_sync() {
  ChunkedSource source(sample_wire(), 1);
  StreamDecoder decoder;
  Value v;
  TEST_EXPECT_OK(decoder.decode(source, v));
  TEST_EXPECT_EQ(v, sample_value());
  TEST_EXPECT_EQ(decoder.buffered_size(), 0u);
}

void test_chunk_size_independence() {
  const auto wire = sample_wire();
  Value expected;
  TEST_EXPECT_OK(msgpk::decode(wire, expected));

  for (const std::size_t chunk : {1u, 2u, 3u, 5u, 7u, 64u, 4096u}) {
    ChunkedSource source(wire, chunk);
    Value v;
    TEST_EXPECT_OK(msgpk::decode_stream(source, v));
    TEST_EXPECT_EQ(v, expected);
    TEST_EXPECT_EQ(source.delivered(), wire.size());
  }
}

void test_small_initial_buffer_grows() {
  DecodeOptions options;
  options.stream_buffer_size = 4;

  auto wire = hex("d9 64");
  wire.resize(2 + 100, static_cast<byte>('x'));
  wire.push_back(0xc0);

  ChunkedSource source(wire, 4096);
  StreamDecoder decoder(options);
  TEST_EXPECT_EQ(decoder.buffer_capacity(), 4u);

  Value v;
  TEST_EXPECT_OK(decoder.decode(source, v));
  TEST_EXPECT_EQ(v, Value::string(std::string(100, 'x')));
  const auto grown = decoder.buffer_capacity();
  TEST_EXPECT(grown >= 102u);

  // 同一实例上继续解码：暂存区不收缩。
  TEST_EXPECT_OK(decoder.decode(source, v));
  TEST_EXPECT(v.is_nil());
  TEST_EXPECT_EQ(decoder.buffer_capacity(), grown);
}

void test_buffer_limit_reports_overflow() {
  DecodeOptions options;
  options.stream_buffer_size = 4;
  options.max_stream_buffer_size = 8;

  auto wire = hex("d9 64");
  wire.resize(2 + 100, static_cast<byte>('x'));
  ChunkedSource source(wire, 4096);
  Value v;
  TEST_EXPECT_EQ(msgpk::decode_stream(source, v, options),
                 msgpk::core::make_error_code(msgpk::core::errc::buffer_overflow));
}

void test_exhausted_source_is_insufficient_data() {
  Value v = Value::integer(1);

  ChunkedSource empty({}, 16);
  TEST_EXPECT_EQ(msgpk::decode_stream(empty, v), errc::insufficient_data);

  ChunkedSource truncated(hex("93 01 02"), 1);
  TEST_EXPECT_EQ(msgpk::decode_stream(truncated, v), errc::insufficient_data);

  ChunkedSource cut_payload(hex("d9 05 68 65"), 2);
  auto ec = msgpk::decode_stream(cut_payload, v);
  TEST_EXPECT_EQ(ec, errc::insufficient_data);
  TEST_EXPECT(!msgpk::is_decode_error(ec));

  TEST_EXPECT_EQ(v, Value::integer(1));
}

void test_decode_errors_surface_from_stream() {
  Value v;
  ChunkedSource bad_header(hex("92 01 c1"), 1);
  TEST_EXPECT_EQ(msgpk::decode_stream(bad_header, v), errc::invalid_header);

  ChunkedSource bad_key(hex("81 a9 5f 5f 70 72 6f 74 6f 5f 5f 01"), 3);
  TEST_EXPECT_EQ(msgpk::decode_stream(bad_key, v), errc::forbidden_key);

  DecodeOptions options;
  options.max_array_length = 1;
  ChunkedSource too_long(hex("92 01 02"), 1);
  TEST_EXPECT_EQ(msgpk::decode_stream(too_long, v, options), errc::length_exceeded);
}

void test_source_error_is_propagated() {
  FailingSource source;
  Value v;
  TEST_EXPECT_EQ(msgpk::decode_stream(source, v), std::make_error_code(std::errc::io_error));
}

void test_consecutive_values_on_one_instance() {
  ChunkedSource source(hex("01 a1 62 93 01 02 03"), 4096);
  StreamDecoder decoder;
  Value v;

  TEST_EXPECT_OK(decoder.decode(source, v));
  TEST_EXPECT_EQ(v, Value::integer(1));
  TEST_EXPECT_EQ(decoder.buffered_size(), 6u);

  TEST_EXPECT_OK(decoder.decode(source, v));
  TEST_EXPECT_EQ(v, Value::string("b"));

  TEST_EXPECT_OK(decoder.decode(source, v));
  TEST_EXPECT_EQ(v, Value::array({Value::integer(1), Value::integer(2), Value::integer(3)}));
  TEST_EXPECT_EQ(decoder.buffered_size(), 0u);

  TEST_EXPECT(decoder.at_boundary());
  TEST_EXPECT_EQ(decoder.decode(source, v), errc::insufficient_data);
  TEST_EXPECT_EQ(source.calls(), 2u);
  TEST_EXPECT(decoder.at_boundary());
}

void test_truncation_is_not_a_boundary() {
  // 头字节已被状态机吸收、暂存区为空，但值并未完成。
  ChunkedSource source(hex("92 01"), 1);
  StreamDecoder decoder;
  Value v;
  TEST_EXPECT_EQ(decoder.decode(source, v), errc::insufficient_data);
  TEST_EXPECT_EQ(decoder.buffered_size(), 0u);
  TEST_EXPECT(!decoder.at_boundary());
}

void test_one_byte_chunks_async() {
  AsyncChunkedSource source(sample_wire(), 1, true);
  StreamDecoder decoder;
  auto [ec, v] = run_async([&] { return decoder.async_decode(source); });
  TEST_EXPECT_OK(ec);
  TEST_EXPECT_EQ(v, sample_value());
}

void test_async_chunk_size_independence() {
  const auto wire = sample_wire();
  for (const std::size_t chunk : {1u, 3u, 17u, 4096u}) {
    AsyncChunkedSource source(wire, chunk, false);
    auto [ec, v] = run_async([&] { return msgpk::async_decode_stream(source); });
    TEST_EXPECT_OK(ec);
    TEST_EXPECT_EQ(v, sample_value());
  }
}

void test_async_eof_is_insufficient_data() {
  AsyncChunkedSource eof_source(hex("92 01"), 1, true);
  auto [ec1, v1] = run_async([&] { return msgpk::async_decode_stream(eof_source); });
  TEST_EXPECT_EQ(ec1, errc::insufficient_data);
  TEST_EXPECT(v1.is_nil());

  AsyncChunkedSource zero_source(hex("92 01"), 1, false);
  auto [ec2, v2] = run_async([&] { return msgpk::async_decode_stream(zero_source); });
  TEST_EXPECT_EQ(ec2, errc::insufficient_data);
}

void test_async_decode_error() {
  AsyncChunkedSource source(hex("81 c0 01"), 1, true);
  DecodeOptions options;
  options.use_key_cache = false;
  auto [ec, v] = run_async([&] { return msgpk::async_decode_stream(source, options); });
  TEST_EXPECT_EQ(ec, errc::invalid_map_key);
}

}  // namespace

int main() {
  test_one_byte_chunks_sync();
  test_chunk_size_independence();
  test_small_initial_buffer_grows();
  test_buffer_limit_reports_overflow();
  test_exhausted_source_is_insufficient_data();
  test_decode_errors_surface_from_stream();
  test_source_error_is_propagated();
  test_consecutive_values_on_one_instance();
  test_truncation_is_not_a_boundary();
  test_one_byte_chunks_async();
  test_async_chunk_size_independence();
  test_async_eof_is_insufficient_data();
  test_async_decode_error();
  return ::msgpk::tests::run_and_report();
}
