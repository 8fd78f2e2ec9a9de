/**
 * @file stdin_stream_decode.cpp
 * @brief 流式解码示例：从 stdin 读取 MessagePack 字节流，逐个输出顶层值。
 *
 * 用法：
 *   some_producer | ./stdin_stream_decode [--sync] [--chunk N]
 *
 * 说明：
 * - 默认使用 asio::posix::stream_descriptor + 协程（AsyncPullSource）；
 * - --sync 使用阻塞 read(2)（PullSource）；
 * - --chunk N 限制每次读取的最大字节数，用于观察“任意分块”下的解码行为；
 * - 结果输出到 stdout，错误输出到 stderr。
 */

#include <msgpk/codec/errc.hpp>
#include <msgpk/codec/stream_decoder.hpp>
#include <msgpk/utils/value_dump.hpp>

#include <asio/as_tuple.hpp>
#include <asio/buffer.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>
#include <asio/posix/stream_descriptor.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>

#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

namespace {

using msgpk::mutable_bytes_view;

class FdSource final : public msgpk::PullSource {
public:
    FdSource(int fd, std::size_t chunk) : fd_(fd), chunk_(chunk) {}

    std::error_code read_some(mutable_bytes_view dst, std::size_t &n) override {
        while (true) {
            const auto r = ::read(fd_, dst.data(), std::min(chunk_, dst.size()));
            if (r >= 0) {
                n = static_cast<std::size_t>(r);
                return {};
            }
            if (errno != EINTR) {
                n = 0;
                return std::error_code(errno, std::generic_category());
            }
        }
    }

private:
    int fd_;
    std::size_t chunk_;
};

class AsyncFdSource final : public msgpk::AsyncPullSource {
public:
    AsyncFdSource(asio::any_io_executor ex, int fd, std::size_t chunk)
        : in_(ex, ::dup(fd)), chunk_(chunk) {}

    asio::awaitable<std::pair<std::error_code, std::size_t>>
    async_read_some(mutable_bytes_view dst) override {
        auto [ec, n] = co_await in_.async_read_some(
            asio::buffer(dst.data(), std::min(chunk_, dst.size())),
            asio::as_tuple(asio::use_awaitable));
        co_return std::pair{ec, n};
    }

private:
    asio::posix::stream_descriptor in_;
    std::size_t chunk_;
};

// 返回值：0 正常结束；1 解码失败；2 数据被截断。
int report_end(const std::error_code &ec, const msgpk::StreamDecoder &decoder) {
    if (ec == msgpk::errc::insufficient_data && decoder.at_boundary()) {
        return 0;
    }
    std::cerr << "stream ended with error: " << ec.message() << "\n";
    return ec == msgpk::errc::insufficient_data ? 2 : 1;
}

int run_sync(std::size_t chunk) {
    FdSource source(STDIN_FILENO, chunk);
    msgpk::StreamDecoder decoder;
    for (std::size_t index = 0;; ++index) {
        msgpk::Value value;
        if (auto ec = decoder.decode(source, value); ec) {
            return report_end(ec, decoder);
        }
        std::cout << "#" << index << ": " << msgpk::utils::dump_value(value) << "\n";
    }
}

asio::awaitable<int> run_async(std::size_t chunk) {
    AsyncFdSource source(co_await asio::this_coro::executor, STDIN_FILENO, chunk);
    msgpk::StreamDecoder decoder;
    for (std::size_t index = 0;; ++index) {
        auto [ec, value] = co_await decoder.async_decode(source);
        if (ec) {
            co_return report_end(ec, decoder);
        }
        std::cout << "#" << index << ": " << msgpk::utils::dump_value(value) << "\n";
    }
}

} // namespace

int main(int argc, char **argv) {
    bool sync = false;
    std::size_t chunk = 4096;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "--sync") {
            sync = true;
        } else if (arg == "--chunk" && i + 1 < argc) {
            chunk = std::max<std::size_t>(1, std::strtoul(argv[++i], nullptr, 10));
        } else {
            std::cerr << "usage: " << argv[0] << " [--sync] [--chunk N]\n";
            return 64;
        }
    }

    if (sync) {
        return run_sync(chunk);
    }

    asio::io_context ioc;
    int rc = 0;
    asio::co_spawn(
        ioc,
        [&]() -> asio::awaitable<void> { rc = co_await run_async(chunk); },
        asio::detached);
    ioc.run();
    return rc;
}
