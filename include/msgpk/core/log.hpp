#pragma once

#include <cstdint>

namespace msgpk::core {

/**
 * @brief 日志级别（用于库内 spdlog 日志的统一控制）。
 *
 * 说明：
 * - 本库内部日志使用 spdlog，但不把 spdlog 类型暴露到 public headers；
 * - 编解码失败会以 debug 级别记录原因（出错的头字节、长度等），默认级别下不可见；
 * - 业务侧可通过 set_log_level 调整全局日志级别。
 */
enum class LogLevel : std::uint8_t {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    critical = 5,
    off = 6,
};

void set_log_level(LogLevel level) noexcept;
[[nodiscard]] LogLevel log_level() noexcept;

// 作用域内临时切换日志级别，析构时恢复进入前的级别（调试单次解码、测试用）。
class ScopedLogLevel final {
public:
    explicit ScopedLogLevel(LogLevel level) noexcept : previous_(log_level()) {
        set_log_level(level);
    }
    ~ScopedLogLevel() { set_log_level(previous_); }

    ScopedLogLevel(const ScopedLogLevel &) = delete;
    ScopedLogLevel &operator=(const ScopedLogLevel &) = delete;

private:
    LogLevel previous_;
};

} // namespace msgpk::core
