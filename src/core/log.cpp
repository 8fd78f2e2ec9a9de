#include "msgpk/core/log.hpp"

#include "core/logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <array>
#include <utility>

namespace msgpk::core {
namespace {

constexpr const char *kLoggerName = "msgpk";

// LogLevel 与 spdlog 级别一一对应（下标即 LogLevel 的数值）。
constexpr std::array<spdlog::level::level_enum, 7> kSpdlogLevels{
    spdlog::level::trace, spdlog::level::debug,    spdlog::level::info,
    spdlog::level::warn,  spdlog::level::err,      spdlog::level::critical,
    spdlog::level::off,
};

[[nodiscard]] spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept {
    const auto index = static_cast<std::size_t>(level);
    if (index >= kSpdlogLevels.size()) {
        return spdlog::level::off;
    }
    return kSpdlogLevels[index];
}

[[nodiscard]] LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept {
    for (std::size_t i = 0; i < kSpdlogLevels.size(); ++i) {
        if (kSpdlogLevels[i] == level) {
            return static_cast<LogLevel>(i);
        }
    }
    return LogLevel::off;
}

std::shared_ptr<spdlog::logger> make_logger() {
    // 业务侧可能提前注册了同名 logger（例如接入自己的 sink），优先复用。
    if (auto existing = spdlog::get(kLoggerName)) {
        return existing;
    }
    auto created = std::make_shared<spdlog::logger>(
        kLoggerName, std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    created->set_level(spdlog::level::warn);
    return created;
}

} // namespace

spdlog::logger &logger() {
    static const std::shared_ptr<spdlog::logger> instance = make_logger();
    return *instance;
}

// 以下两个接口保持 noexcept：首次调用会创建 logger，若此时内存分配失败则进程终止。
void set_log_level(LogLevel level) noexcept {
    // 只调整本库 logger，不影响业务侧的全局 spdlog 配置。
    logger().set_level(to_spdlog_level(level));
}

LogLevel log_level() noexcept { return from_spdlog_level(logger().level()); }

} // namespace msgpk::core
