#include "msgpk/codec/stream_decoder.hpp"

#include "msgpk/codec/errc.hpp"

#include "core/logger.hpp"

#include <asio/error.hpp>
#include <spdlog/spdlog.h>

namespace msgpk {

StreamDecoder::StreamDecoder(const DecodeOptions& options)
  : machine_(options),
    scratch_(options.stream_buffer_size, options.max_stream_buffer_size) {}

std::error_code StreamDecoder::step(Value& out, std::size_t& need) {
  need = 0;
  InputCursor cursor(scratch_.readable_bytes());
  auto ec = machine_.run(cursor, out);

  // 提交点之前的字节已被状态机吸收（头字节哨兵/帧栈），可以丢弃。
  auto consume_ec = scratch_.consume(cursor.committed());
  if (consume_ec) {
    return consume_ec;
  }
  if (ec == errc::insufficient_data) {
    need = cursor.shortfall();
  }
  return ec;
}

std::error_code StreamDecoder::prepare_pull(std::size_t need, mutable_bytes_view& dst) {
  auto ec = scratch_.ensure_writable(need);
  if (ec) {
    core::logger().debug("stream buffer cannot hold {} more bytes: {}", need, ec.message());
    return ec;
  }
  dst = scratch_.writable_bytes();
  return {};
}

/*
 * 同步流程：
 * - 先用已缓冲字节推进状态机；
 * - insufficient_data 时按 shortfall 反复拉取，凑够后重入状态机；
 * - 拉取源耗尽（n == 0）即 insufficient_data。
 */
std::error_code StreamDecoder::decode(PullSource& source, Value& out) {
  machine_.reset();
  Value result;
  while (true) {
    std::size_t need = 0;
    auto ec = step(result, need);
    if (!ec) {
      out = std::move(result);
      return {};
    }
    if (ec != errc::insufficient_data) {
      core::logger().debug("stream decode failed: {}", ec.message());
      return ec;
    }

    while (need > 0) {
      mutable_bytes_view dst{};
      ec = prepare_pull(need, dst);
      if (ec) {
        return ec;
      }
      std::size_t n = 0;
      ec = source.read_some(dst, n);
      if (ec) {
        return ec;
      }
      if (n == 0) {
        return make_error_code(errc::insufficient_data);
      }
      ec = scratch_.commit(n);
      if (ec) {
        return ec;
      }
      need = n >= need ? 0 : need - n;
    }
  }
}

asio::awaitable<std::pair<std::error_code, Value>> StreamDecoder::async_decode(AsyncPullSource& source) {
  machine_.reset();
  Value result;
  while (true) {
    std::size_t need = 0;
    auto ec = step(result, need);
    if (!ec) {
      co_return std::pair{std::error_code{}, std::move(result)};
    }
    if (ec != errc::insufficient_data) {
      core::logger().debug("stream decode failed: {}", ec.message());
      co_return std::pair{ec, Value{}};
    }

    while (need > 0) {
      mutable_bytes_view dst{};
      ec = prepare_pull(need, dst);
      if (ec) {
        co_return std::pair{ec, Value{}};
      }
      auto [read_ec, n] = co_await source.async_read_some(dst);
      if (read_ec == asio::error::eof || (!read_ec && n == 0)) {
        co_return std::pair{make_error_code(errc::insufficient_data), Value{}};
      }
      if (read_ec) {
        co_return std::pair{read_ec, Value{}};
      }
      ec = scratch_.commit(n);
      if (ec) {
        co_return std::pair{ec, Value{}};
      }
      need = n >= need ? 0 : need - n;
    }
  }
}

}  // namespace msgpk
