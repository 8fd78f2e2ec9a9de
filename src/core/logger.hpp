#pragma once

#include <spdlog/logger.h>

namespace msgpk::core {

// 库内部共用的 spdlog logger（名称 "msgpk"，默认 warn 级别，输出到 stderr）。
// 仅供 src/ 内部使用，不出现在 public headers 中。
spdlog::logger &logger();

} // namespace msgpk::core
